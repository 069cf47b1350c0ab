#ifndef DIFFUSION_FEATURES_TIMERS_HPP
#define DIFFUSION_FEATURES_TIMERS_HPP

#include "common.hpp"

class Timers
{
private:
    using Time = decltype( std::chrono::steady_clock::now());
    using Diff = std::chrono::milliseconds;
    struct Clock
    {
        Time c1;
        Time c2;
        Diff diff{Diff::zero()};
    };

    using TimersDictionary = std::map<std::string, Clock>;

    static TimersDictionary &_timers()
    {
        static TimersDictionary singleton;
        return singleton;
    }

    static std::mutex &_mutex()
    {
        static std::mutex m;
        return m;
    }

public:
    static void tic( const std::string &label )
    {
        fmt::print( "[{}...]\n", label );
        std::lock_guard<std::mutex> lock( _mutex());
        _timers()[label].c1 = std::chrono::steady_clock::now();
    }

    static void toc( const std::string &label )
    {
        fmt::print( "[DONE][{}]\n", label );
        std::lock_guard<std::mutex> lock( _mutex());
        auto &clock = _timers()[label];
        clock.c2 = std::chrono::steady_clock::now();
        clock.diff += std::chrono::duration_cast<Diff>( clock.c2 - clock.c1 );
    }

    static auto duration_ms( const std::string &label )
    {
        std::lock_guard<std::mutex> lock( _mutex());
        return _timers()[label].diff.count();
    }

    static auto duration_s( const std::string &label )
    {
        return duration_ms( label ) / 1000;
    }

    static void report_ms( const std::string &label )
    {
        fmt::print( "[Time elapsed for {}:{} msec]\n", label, duration_ms( label ));
    }

    static void report_s( const std::string &label )
    {
        fmt::print( "[Time elapsed for {}:{} seconds]\n", label, duration_s( label ));
    }

    template<typename ReportedFunction>
    static auto reported_invoke_s(
            ReportedFunction fn,
            const std::string &label
    )
    {
        tic( label );
        auto ret = fn();
        toc( label );
        report_s( label );
        return ret;
    }

    /**
     * @brief Invoke fn without touching the shared registry, return its result
     * with the elapsed milliseconds.
     */
    template<typename TimedFunction>
    static auto timed_invoke_ms( TimedFunction fn )
    {
        const auto start = std::chrono::steady_clock::now();
        auto ret = fn();
        const auto elapsed = std::chrono::duration_cast<Diff>( std::chrono::steady_clock::now() - start );
        return std::make_pair( std::move( ret ), static_cast<double>( elapsed.count()));
    }
};


#endif //DIFFUSION_FEATURES_TIMERS_HPP
