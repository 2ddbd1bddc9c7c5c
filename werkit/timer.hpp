#pragma once

#include <chrono>

#include "common.hpp"

typedef std::chrono::steady_clock Time;
typedef std::chrono::duration<float> fsec;

class Timer;

// Charges the time between its construction and destruction to one section of a timer.
class TimerScope
{
    friend class Timer;

    Timer &timer;
    Time::time_point start_time;
    string section;

    TimerScope(Timer &, const string &);

public:
    ~TimerScope();
};

// Wall time and number of runs per named section. Sections may be timed from several threads.
class Timer
{
    friend class TimerScope;

    struct Section
    {
        float seconds = 0.0;
        size_t runs = 0;
    };

    paramap<string, Section> sections;
    bool enabled = true;

    void record(const string &, float);

public:
    TimerScope start(const string &);
    void enable();
    void disable();

    float seconds(const string &) const;
    size_t runs(const string &) const;
    // Log every section with its share of the total and its average run.
    void show_stats() const;
};
