#include "crash_handling.h"
#include <csignal>
#include <cstdlib>
#include <cstdint>
#include <bz/core.h>
#include <bz/format.h>
#include <backtrace.h>
#include "colors.h"

static void error_callback([[maybe_unused]] void *data, char const *msg, int errnum)
{
	bz::print(stderr, "error while printing stack trace: {} (error {})\n", msg, errnum);
}

static int full_callback(void *data, uintptr_t pc, char const *filename, int line, [[maybe_unused]] char const *func_name)
{
	auto &count = *reinterpret_cast<int *>(data);

	// frames without line information belong to the runtime or to libraries
	if (line != 0)
	{
		auto const ptr = reinterpret_cast<void *>(pc);
		bz::print(stderr, "    #{:2}: {}:{} ({})\n", count, filename, line, ptr);
		count += 1;
	}
	return 0;
}

static void print_stacktrace(int skip)
{
	static auto const backtrace = backtrace_create_state(nullptr, false, &error_callback, nullptr);

	int count = 0;
	backtrace_full(backtrace, skip, &full_callback, &error_callback, &count);
}

static void print_internal_error_message(bz::u8string_view msg)
{
	bz::print(
		stderr, "{}prov:{} {}internal error:{} {}\n",
		colors::bright_white, colors::clear, colors::bright_red, colors::clear,
		msg
	);
}

static void handle_segv(int)
{
	print_internal_error_message("segmentation fault");
	print_stacktrace(2);
	std::_Exit(-1);
}

static void handle_int(int)
{
	bz::print(stderr, "Program interrupted\n");
	std::_Exit(-1);
}

static void handle_ill(int)
{
	print_internal_error_message("invalid instruction");
	print_stacktrace(2);
	std::_Exit(-1);
}

// bz aborts after the handler returns
static void handle_assert_fail(char const *expr, char const *file, int line)
{
	print_internal_error_message(bz::format("assertion failed at {}:{}", file, line));
	bz::print(stderr, "    expression: {}\n", expr);
	print_stacktrace(3);
}

static void handle_unreachable(char const *file, int line)
{
	print_internal_error_message(bz::format("hit unreachable code at {}:{}", file, line));
	print_stacktrace(3);
}

void register_crash_handlers(void)
{
	std::signal(SIGSEGV, &handle_segv);
	std::signal(SIGINT,  &handle_int);
	std::signal(SIGILL,  &handle_ill);

	bz::register_assert_fail_handler(&handle_assert_fail);
	bz::register_unreachable_handler(&handle_unreachable);
}
