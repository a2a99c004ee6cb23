#include "copy_paths.h"
#include "navigator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::function<void()> body;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void ClobberMemory()
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "ComputeStats called with empty samples");
    Stats stats;
    stats.min_ns = *std::min_element(samples.begin(), samples.end());
    stats.max_ns = *std::max_element(samples.begin(), samples.end());
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean_ns = sum / samples.size();
    double variance = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double diff = samples[i] - stats.mean_ns;
        variance += diff * diff;
    }
    variance /= samples.size();
    stats.stddev_ns = std::sqrt(variance);
    std::sort(samples.begin(), samples.end());
    if (samples.size() % 2 == 0) {
        std::size_t idx = samples.size() / 2;
        stats.median_ns = (samples[idx - 1] + samples[idx]) * 0.5;
    } else {
        stats.median_ns = samples[samples.size() / 2];
    }
    return stats;
}

inline std::size_t
ClampIterations(std::size_t base, double scale)
{
    double scaled = base * scale;
    if (scaled < 1.0) {
        return 1;
    }
    return static_cast<std::size_t>(scaled);
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos) {
            return;
        }
        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }

        const std::size_t inner = ClampIterations(bench_case.inner_iterations, config_.scale);

        for (std::size_t w = 0; w < config_.warmup_runs; ++w) {
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
        }

        std::vector<double> samples;
        samples.reserve(config_.measure_runs);
        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
            Clock::time_point end = Clock::now();
            double total_ns = static_cast<double>(
              std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)
                .count());
            samples.push_back(total_ns / inner);
            ClobberMemory();
        }

        Stats stats = ComputeStats(samples);
        std::printf("%-32s %10.2f ns/op  (median %.2f | min %.2f | max %.2f | stddev %.2f)  inner=%-6zu\n",
                    bench_case.name.c_str(),
                    stats.mean_ns,
                    stats.median_ns,
                    stats.min_ns,
                    stats.max_ns,
                    stats.stddev_ns,
                    inner);
    }

  private:
    BenchConfig config_;
};

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("navigate_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::exit(0);
        } else if (HasPrefix(arg, "--warmup=")) {
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 9, NULL, 10));
        } else if (HasPrefix(arg, "--runs=")) {
            config.measure_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 7, NULL, 10));
        } else if (HasPrefix(arg, "--scale=")) {
            config.scale = std::atof(arg.c_str() + 8);
        } else if (HasPrefix(arg, "--filter=")) {
            config.filter = arg.substr(9);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (arg == "--list") {
            config.list_only = true;
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0) {
        config.measure_runs = 1;
    }
    return config;
}

// Counts leaves and dead ends, nothing else.
class LeafCounter : public jnav::NavigateAction
{
  public:
    std::uint64_t leaves = 0;
    std::uint64_t misses = 0;

    bool onNavigationStart(const jnav::Json&, const std::vector<std::string>&) override
    {
        return true;
    }
    bool onNextPath(const std::string&) override
    {
        return true;
    }
    void onPathEnd(const std::string&) override
    {
    }
    void onNavigationEnd() override
    {
    }
    void onPrematureBranchEnd(const jnav::TreePath&, const jnav::Json&) override
    {
        ++misses;
    }
    bool onObjectStartAndRecur(const jnav::TreePath&, const jnav::Json&) override
    {
        return true;
    }
    bool onArrayStartAndRecur(const jnav::TreePath&, const jnav::Json&) override
    {
        return true;
    }
    void onObjectLeaf(const jnav::TreePath&, const jnav::Json&) override
    {
        ++leaves;
    }
    void onArrayLeaf(size_t, const jnav::Json&) override
    {
        ++leaves;
    }
    void onObjectEnd(const jnav::TreePath&) override
    {
    }
    void onArrayEnd(const jnav::TreePath&) override
    {
    }
    bool failPathSilently(const std::string&, const std::exception&) override
    {
        return false;
    }
    bool failPathFast(const std::string&, const std::exception&) override
    {
        return true;
    }
};

// {"orders":[{"id":0,"customer":{"name":"c0","tier":"gold"},
//             "items":[{"sku":"s0","qty":1},...]},...]}
inline jnav::Json
MakeOrders(std::size_t orders, std::size_t items)
{
    jnav::Json root;
    jnav::Json& list = root["orders"];
    list.setArray();
    for (std::size_t i = 0; i < orders; ++i) {
        jnav::Json order;
        order["id"] = static_cast<long long>(i);
        order["customer"]["name"] = "c" + std::to_string(i);
        order["customer"]["tier"] = i % 3 ? "silver" : "gold";
        order["items"].setArray();
        for (std::size_t j = 0; j < items; ++j) {
            jnav::Json item;
            item["sku"] = "s" + std::to_string(j);
            item["qty"] = static_cast<long long>(j + 1);
            order["items"].getArray().push_back(std::move(item));
        }
        list.getArray().push_back(std::move(order));
    }
    root["meta"]["count"] = static_cast<long long>(orders);
    return root;
}

} // namespace bench

int
main(int argc, char** argv)
{
    using namespace bench;

    BenchConfig config = ParseArgs(argc, argv);

    const jnav::Json small_orders = MakeOrders(10, 3);
    const jnav::Json large_orders = MakeOrders(1000, 10);

    std::vector<BenchCase> cases;

    cases.push_back({ "treepath.split",
                      10000,
                      [&]() {
                          jnav::TreePath path("orders.items.sku.extra.deep");
                          DoNotOptimize(path);
                          g_sink += path.length();
                      } });

    cases.push_back({ "treepath.clone_walk",
                      10000,
                      [&]() {
                          jnav::TreePath path("orders.items.sku");
                          path.next();
                          jnav::TreePath branch = path.clone();
                          while (branch.hasNext())
                              g_sink += branch.next().size();
                      } });

    cases.push_back({ "navigate.single_leaf",
                      10000,
                      [&]() {
                          LeafCounter counter;
                          jnav::Navigator nav(&counter, { "meta.count" });
                          nav.navigate(large_orders);
                          g_sink += counter.leaves;
                      } });

    cases.push_back({ "navigate.fan_out_small",
                      2000,
                      [&]() {
                          LeafCounter counter;
                          jnav::Navigator nav(&counter, { "orders.customer.name", "orders.items.qty" });
                          nav.navigate(small_orders);
                          g_sink += counter.leaves;
                      } });

    cases.push_back({ "navigate.fan_out_large",
                      20,
                      [&]() {
                          LeafCounter counter;
                          jnav::Navigator nav(&counter, { "orders.customer.name", "orders.items.qty" });
                          nav.navigate(large_orders);
                          g_sink += counter.leaves;
                      } });

    cases.push_back({ "navigate.missing_large",
                      20,
                      [&]() {
                          LeafCounter counter;
                          jnav::Navigator nav(&counter, { "orders.customer.email" });
                          nav.navigate(large_orders);
                          g_sink += counter.misses;
                      } });

    cases.push_back({ "copy_paths.extract_small",
                      2000,
                      [&]() {
                          jnav::CopyPathsAction copy;
                          jnav::Navigator nav(&copy, { "orders.id", "orders.customer.tier" });
                          nav.navigate(small_orders);
                          DoNotOptimize(copy.result());
                          g_sink += copy.result().isObject();
                      } });

    cases.push_back({ "copy_paths.extract_large",
                      10,
                      [&]() {
                          jnav::CopyPathsAction copy;
                          jnav::Navigator nav(&copy, { "orders.id", "orders.items.sku", "meta" });
                          nav.navigate(large_orders);
                          DoNotOptimize(copy.result());
                          g_sink += copy.result().isObject();
                      } });

    if (config.list_only) {
        for (std::size_t i = 0; i < cases.size(); ++i) {
            Runner(config).run(cases[i]);
        }
        return 0;
    }

    std::printf("navigate_perf: warmup=%zu runs=%zu scale=%.2f\n",
                config.warmup_runs,
                config.measure_runs,
                config.scale);

    Runner runner(config);
    for (std::size_t i = 0; i < cases.size(); ++i) {
        runner.run(cases[i]);
    }

    std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));
    return 0;
}
