#pragma once
#include <gtest/gtest.h>
#include <butterfly/log.hpp>
#include <butterfly/network_graph.hpp>
#include <butterfly/network_metrics.hpp>
#include <butterfly/pressure.hpp>
#include <chrono>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

/**
 * Build a graph with organisms 0..n-1 and the given connections
 */
inline butterfly::NetworkGraph create_test_graph(size_t n,
        const std::vector<std::pair<butterfly::OrganismId, butterfly::OrganismId>>& connections) {
    butterfly::NetworkGraph graph;
    for (size_t i = 0; i < n; ++i) {
        graph.add_organism();
    }
    for (const auto& [a, b] : connections) {
        graph.connect(a, b);
    }
    return graph;
}

/**
 * Metrics where each collapse condition is independently on or off
 * (against the default thresholds and a collapse threshold of 500)
 */
inline butterfly::NetworkMetrics make_metrics(bool count, bool clustering, bool modularity, bool path) {
    butterfly::NetworkMetrics m;
    m.organism_count = count ? 520 : 120;
    m.connection_count = m.organism_count * 2;
    m.average_degree = 4.0;
    m.clustering_coefficient = clustering ? 0.62 : 0.18;
    m.modularity = modularity ? 0.12 : 0.55;
    m.average_path_length = path ? 2.4 : 6.8;
    m.component_count = 1;
    return m;
}

/**
 * Pressure strategy that reports the "vp" trait verbatim
 */
class ScriptedPressure : public butterfly::PressureFunction {
public:
    std::optional<double> compute(const butterfly::TraitMap& traits) const override {
        auto it = traits.find("vp");
        if (it == traits.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Pressure strategy that always throws
 */
class ThrowingPressure : public butterfly::PressureFunction {
public:
    std::optional<double> compute(const butterfly::TraitMap&) const override {
        throw std::runtime_error("pressure source offline");
    }
};

/**
 * Poll a predicate until it holds or the timeout passes
 */
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

/**
 * Captures log lines for the lifetime of the object
 */
class LogCapture {
public:
    explicit LogCapture(butterfly::log::Level level = butterfly::log::Level::Info)
        : previous_level_(butterfly::log::min_level()) {
        {
            std::lock_guard<std::mutex> lock(mutex());
            lines().clear();
        }
        butterfly::log::set_min_level(level);
        butterfly::log::set_log_callback(&LogCapture::record);
    }
    ~LogCapture() {
        butterfly::log::clear_log_callback();
        butterfly::log::set_min_level(previous_level_);
    }

    static std::vector<std::string> captured() {
        std::lock_guard<std::mutex> lock(mutex());
        return lines();
    }

    static bool contains(const std::string& needle) {
        for (const auto& line : captured()) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    butterfly::log::Level previous_level_;

    static void record(butterfly::log::Level, const char* message) {
        std::lock_guard<std::mutex> lock(mutex());
        lines().emplace_back(message);
    }
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }
    static std::vector<std::string>& lines() {
        static std::vector<std::string> l;
        return l;
    }
};

} // namespace test_utils
