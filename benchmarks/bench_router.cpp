// Waypoint Router Benchmark
// Measures lookup, dispatch and case-insensitive path recovery on a
// REST-style route table, plus the SIMD prefix helper vs a scalar loop

#include "../src/core/simd.hpp"
#include "../src/router/router.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace waypoint;

namespace scalar {

size_t common_prefix_length(const char* a, const char* b, size_t len) noexcept {
    size_t i = 0;
    while (i < len && a[i] == b[i]) {
        i++;
    }
    return i;
}

} // namespace scalar

// Benchmark helper
template<typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

const std::vector<std::pair<http::Method, std::string>> kRoutes = {
    {http::Method::GET, "/"},
    {http::Method::GET, "/authorizations"},
    {http::Method::GET, "/authorizations/:id"},
    {http::Method::POST, "/authorizations"},
    {http::Method::DELETE, "/authorizations/:id"},
    {http::Method::GET, "/events"},
    {http::Method::GET, "/repos/:owner/:repo/events"},
    {http::Method::GET, "/networks/:owner/:repo/events"},
    {http::Method::GET, "/orgs/:org/events"},
    {http::Method::GET, "/users/:user/received_events"},
    {http::Method::GET, "/users/:user/received_events/public"},
    {http::Method::GET, "/users/:user/events"},
    {http::Method::GET, "/users/:user/events/public"},
    {http::Method::GET, "/users/:user/events/orgs/:org"},
    {http::Method::GET, "/feeds"},
    {http::Method::GET, "/notifications"},
    {http::Method::GET, "/repos/:owner/:repo/notifications"},
    {http::Method::PUT, "/notifications"},
    {http::Method::GET, "/notifications/threads/:id"},
    {http::Method::GET, "/repos/:owner/:repo/stargazers"},
    {http::Method::GET, "/users/:user/starred"},
    {http::Method::GET, "/user/starred"},
    {http::Method::GET, "/user/starred/:owner/:repo"},
    {http::Method::PUT, "/user/starred/:owner/:repo"},
    {http::Method::DELETE, "/user/starred/:owner/:repo"},
    {http::Method::GET, "/gists"},
    {http::Method::GET, "/gists/:id"},
    {http::Method::POST, "/gists"},
    {http::Method::GET, "/repos/:owner/:repo/git/blobs/:sha"},
    {http::Method::GET, "/repos/:owner/:repo/git/trees/:sha"},
    {http::Method::GET, "/issues"},
    {http::Method::GET, "/repos/:owner/:repo/issues/:number"},
    {http::Method::GET, "/repos/:owner/:repo/contents/*path"},
    {http::Method::GET, "/search/repositories"},
    {http::Method::GET, "/static/*filepath"},
};

router::Router<int> make_router() {
    router::RouterBuilder<int> builder;
    int id = 0;
    for (const auto& [method, pattern] : kRoutes) {
        builder.handle(method, pattern, id++);
    }
    return std::move(builder).build();
}

void benchmark_lookup(const router::Router<int>& table) {
    std::cout << "\n=== Lookup Benchmark ===\n";

    const size_t iterations = 2000000;
    const std::vector<std::pair<http::Method, std::string>> requests = {
        {http::Method::GET, "/"},
        {http::Method::GET, "/authorizations"},
        {http::Method::GET, "/users/gopher/events/public"},
        {http::Method::GET, "/repos/julienschmidt/httprouter/stargazers"},
        {http::Method::GET, "/repos/julienschmidt/httprouter/git/trees/d4c8e2"},
        {http::Method::GET, "/repos/julienschmidt/httprouter/contents/docs/index.md"},
        {http::Method::GET, "/static/css/site.css"},
        {http::Method::DELETE, "/user/starred/julienschmidt/httprouter"},
    };

    std::cout << std::setw(60) << std::left << "Request" << std::right
              << std::setw(15) << "lookup (ns)"
              << std::setw(15) << "resolve (ns)" << "\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto& [method, path] : requests) {
        double lookup_time = benchmark([&]() {
            volatile bool matched = table.lookup(method, path).matched();
            (void)matched;
        }, iterations);

        double resolve_time = benchmark([&]() {
            volatile auto action = table.resolve(method, path).action;
            (void)action;
        }, iterations);

        std::cout << std::setw(60) << std::left << path << std::right
                  << std::setw(15) << std::fixed << std::setprecision(2) << lookup_time
                  << std::setw(15) << std::fixed << std::setprecision(2) << resolve_time << "\n";
    }
}

void benchmark_fixed_path(const router::Router<int>& table) {
    std::cout << "\n=== Case-insensitive Path Recovery ===\n";

    const size_t iterations = 500000;
    const std::vector<std::string> requests = {
        "/AUTHORIZATIONS",
        "/Users/gopher/Events/Public",
        "/repos/julienschmidt/httprouter/STARGAZERS/",
        "/STATIC/css/site.css",
        "/no/such/route",
    };
    const auto* tree = table.tree(http::Method::GET);

    std::cout << std::setw(50) << std::left << "Request" << std::right
              << std::setw(15) << "find (ns)" << "\n";
    std::cout << std::string(65, '-') << "\n";

    for (const auto& path : requests) {
        double find_time = benchmark([&]() {
            volatile bool found = tree->find_case_insensitive_path(path, true).has_value();
            (void)found;
        }, iterations);

        std::cout << std::setw(50) << std::left << path << std::right
                  << std::setw(15) << std::fixed << std::setprecision(2) << find_time << "\n";
    }
}

void benchmark_common_prefix() {
    std::cout << "\n=== common_prefix_length Benchmark ===\n";
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> letter('a', 'z');

    const size_t iterations = 1000000;
    std::vector<size_t> sizes = {8, 16, 32, 64, 128, 256};

    std::cout << std::setw(10) << "Size"
              << std::setw(15) << "SIMD (ns)"
              << std::setw(15) << "Scalar (ns)"
              << std::setw(15) << "Speedup" << "\n";
    std::cout << std::string(55, '-') << "\n";

    for (size_t size : sizes) {
        std::string a;
        for (size_t i = 0; i < size; i++) {
            a += static_cast<char>(letter(rng));
        }
        std::string b = a;
        b.back() = '/';  // Differ in the last byte

        double simd_time = benchmark([&]() {
            volatile auto result = simd::common_prefix_length(a.data(), b.data(), a.size());
            (void)result;
        }, iterations);

        double scalar_time = benchmark([&]() {
            volatile auto result = scalar::common_prefix_length(a.data(), b.data(), a.size());
            (void)result;
        }, iterations);

        std::cout << std::setw(10) << size
                  << std::setw(15) << std::fixed << std::setprecision(2) << simd_time
                  << std::setw(15) << std::fixed << std::setprecision(2) << scalar_time
                  << std::setw(15) << std::fixed << std::setprecision(2) << (scalar_time / simd_time) << "x\n";
    }
}

int main() {
    std::cout << "Waypoint Router Performance Benchmark\n";
    std::cout << "=====================================\n";

    const auto table = make_router();
    const auto stats = table.get_stats();
    std::cout << "\nRoute table:\n";
    std::cout << "  Routes: " << stats.total_routes << "\n";
    std::cout << "  Nodes:  " << stats.total_nodes << "\n";
    std::cout << "  Depth:  " << stats.max_depth << "\n";

    benchmark_lookup(table);
    benchmark_fixed_path(table);
    benchmark_common_prefix();

    std::cout << "\n";
    return 0;
}
