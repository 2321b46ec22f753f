/**
 * @file debug.h
 * @brief Opt-in diagnostic tracing for csvstream readers and writers.
 */

#ifndef CSVSTREAM_DEBUG_H
#define CSVSTREAM_DEBUG_H

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace csvstream {

struct DebugConfig {
    bool verbose = false;  // lifecycle: open, close, cancel, end of stream
    bool io = false;       // every fetch from a source and flush to a sink
    bool timing = false;   // wall time per public operation
    FILE* output = nullptr;

    DebugConfig() = default;

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        config.io = true;
        config.timing = true;
        return config;
    }

    bool enabled() const {
        return verbose || io || timing;
    }
};

struct PhaseTime {
    std::string name;
    std::chrono::nanoseconds duration;
    size_t bytes_processed = 0;

    double milliseconds() const {
        return duration.count() / 1e6;
    }
};

/**
 * @class DebugTrace
 * @brief Debug logging and operation timing.
 *
 * @note Thread Safety: This class is NOT thread-safe. Each reader and writer
 *       owns one trace and only touches it from its I/O worker thread.
 */
class DebugTrace {
public:
    explicit DebugTrace(const DebugConfig& config = DebugConfig())
        : config_(config) {}

    bool enabled() const { return config_.enabled(); }
    bool verbose() const { return config_.verbose; }
    bool io() const { return config_.io; }
    bool timing() const { return config_.timing; }

    // Note: The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
    #if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
    #endif
    void log(const char* fmt, ...) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[csvstream] ");
        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

    void log_fetch(size_t requested, size_t received, size_t total) const {
        if (!config_.io) return;
        FILE* out = stream();
        if (received == 0) {
            fprintf(out, "[csvstream] FETCH: end of source after %zu bytes\n", total);
        } else {
            fprintf(out, "[csvstream] FETCH: %zu of %zu bytes (total %zu)\n",
                    received, requested, total);
        }
        fflush(out);
    }

    void log_flush(size_t bytes, size_t total) const {
        if (!config_.io) return;
        FILE* out = stream();
        fprintf(out, "[csvstream] FLUSH: %zu bytes (total %zu)\n", bytes, total);
        fflush(out);
    }

    void start_phase(const char* phase_name) {
        if (!config_.timing) return;
        current_phase_ = phase_name;
        phase_start_ = std::chrono::steady_clock::now();
    }

    void end_phase(size_t bytes_processed = 0) {
        if (!config_.timing) return;
        auto end = std::chrono::steady_clock::now();
        PhaseTime pt;
        pt.name = current_phase_;
        pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
        pt.bytes_processed = bytes_processed;
        phase_times_.push_back(pt);
    }

    void print_timing_summary() const {
        if (!config_.timing || phase_times_.empty()) return;
        FILE* out = stream();
        fprintf(out, "\n[csvstream] TIMING SUMMARY:\n");
        fprintf(out, "  %-24s %8s %12s %12s\n", "Operation", "Calls", "Time (ms)", "Bytes");
        fprintf(out, "  %s\n", std::string(60, '-').c_str());

        // Aggregate by name, keeping first-seen order
        std::vector<PhaseTime> totals;
        std::vector<size_t> calls;
        for (const auto& pt : phase_times_) {
            size_t i = 0;
            while (i < totals.size() && totals[i].name != pt.name) ++i;
            if (i == totals.size()) {
                totals.push_back(PhaseTime{pt.name, std::chrono::nanoseconds{0}, 0});
                calls.push_back(0);
            }
            totals[i].duration += pt.duration;
            totals[i].bytes_processed += pt.bytes_processed;
            ++calls[i];
        }
        for (size_t i = 0; i < totals.size(); ++i) {
            fprintf(out, "  %-24s %8zu %12.3f %12zu\n", totals[i].name.c_str(), calls[i],
                    totals[i].milliseconds(), totals[i].bytes_processed);
        }
        fprintf(out, "\n");
        fflush(out);
    }

    const std::vector<PhaseTime>& get_phase_times() const {
        return phase_times_;
    }

    void clear_timing() {
        phase_times_.clear();
    }

private:
    DebugConfig config_;
    std::string current_phase_;
    std::chrono::steady_clock::time_point phase_start_;
    std::vector<PhaseTime> phase_times_;

    FILE* stream() const {
        return config_.output ? config_.output : stderr;
    }
};

class ScopedPhaseTimer {
public:
    ScopedPhaseTimer(DebugTrace& trace, const char* phase_name, size_t bytes = 0)
        : trace_(trace), bytes_(bytes) {
        trace_.start_phase(phase_name);
    }

    ~ScopedPhaseTimer() {
        trace_.end_phase(bytes_);
    }

    ScopedPhaseTimer(const ScopedPhaseTimer&) = delete;
    ScopedPhaseTimer& operator=(const ScopedPhaseTimer&) = delete;

    void set_bytes(size_t bytes) { bytes_ = bytes; }

private:
    DebugTrace& trace_;
    size_t bytes_;
};

#define CSVSTREAM_CONCAT_INNER(a, b) a##b
#define CSVSTREAM_CONCAT(a, b) CSVSTREAM_CONCAT_INNER(a, b)
#define CSVSTREAM_TIMED_PHASE(trace, name, bytes) \
    csvstream::ScopedPhaseTimer CSVSTREAM_CONCAT(_phase_timer_, __LINE__)(trace, name, bytes)

}  // namespace csvstream

#endif  // CSVSTREAM_DEBUG_H
