#include "timer.hpp"

TimerScope::TimerScope(Timer &timer,
                       const string &section) : timer(timer),
                                                start_time(Time::now()),
                                                section(section) {}

TimerScope::~TimerScope()
{
    if (!timer.enabled)
        return;
    fsec fs = Time::now() - start_time;
    timer.record(section, fs.count());
}

void Timer::record(const string &section, float seconds)
{
    sections.try_emplace_l(
        section,
        [seconds](Section &s) {
            s.seconds += seconds;
            ++s.runs;
        },
        Section{seconds, 1});
}

TimerScope Timer::start(const string &section) { return TimerScope(*this, section); }

void Timer::enable()
{
    enabled = true;
    SPDLOG_DEBUG("Timer enabled.");
}

void Timer::disable()
{
    enabled = false;
    SPDLOG_DEBUG("Timer disabled.");
}

float Timer::seconds(const string &section) const
{
    float ret = 0.0;
    sections.if_contains(section, [&ret](const Section &s) { ret = s.seconds; });
    return ret;
}

size_t Timer::runs(const string &section) const
{
    size_t ret = 0;
    sections.if_contains(section, [&ret](const Section &s) { ret = s.runs; });
    return ret;
}

void Timer::show_stats() const
{
    float total = 0.0;
    for (const auto &item : sections)
        total += item.second.seconds;
    SPDLOG_INFO("{0} sections timed, {1:.3f}s in total.", sections.size(), total);
    auto names = vec<string>();
    for (const auto &item : sections)
        names.push_back(item.first);
    std::sort(names.begin(), names.end());
    for (const auto &name : names)
    {
        float s = seconds(name);
        size_t n = runs(name);
        float share = (total > 0.0) ? s / total * 100 : 0.0;
        SPDLOG_INFO("{0}: {1:.3f}s ({2:.1f}%) over {3} runs, {4:.5f}s per run.", name, s, share, n, s / n);
    }
}
