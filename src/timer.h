#ifndef TIMER_H
#define TIMER_H

#include <chrono>
#include <bz/u8string.h>
#include <bz/vector.h>

struct timer : std::chrono::steady_clock
{
	struct timing_section_t
	{
		bz::u8string name;
		time_point begin;
		time_point end;
	};

	bz::vector<timing_section_t> timing_sections;
	bool running = false;

	void start_section(bz::u8string name)
	{
		if (this->running)
		{
			this->end_section();
		}

		this->running = true;
		auto &new_section = this->timing_sections.emplace_back();
		new_section.name = std::move(name);
		new_section.begin = now();
	}

	void end_section(void)
	{
		bz_assert(this->running);
		bz_assert(this->timing_sections.not_empty());
		this->timing_sections.back().end = now();
		this->running = false;
	}

	static double in_ms(duration time)
	{
		return static_cast<double>(
			std::chrono::duration_cast<std::chrono::nanoseconds>(time).count()
		) * 1e-6;
	}

	duration get_total_duration(void) const
	{
		auto result = duration();
		for (auto const &[name, begin, end] : this->timing_sections)
		{
			result += end - begin;
		}
		return result;
	}
};

#endif // TIMER_H
