//! # scoped_demo
//!
//! Simulates a request handler that fans work out to a small pool of worker
//! threads. The request id and tenant are bound once at the top of the
//! request and read deep inside the workers, which receive the scope through
//! an explicit capture.
//!
//! Usage: `scoped_demo [requests] [--log-level=<level>] [-v|-vv|-vvv]`

#include "log/log.hpp"
#include "scoped/scope.hpp"

#include <charconv>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

scoped::Var<std::string> request_id{"demo/request-id"};
scoped::Var<std::string> tenant{"demo/tenant", "public"};
scoped::Var<int> worker_count{"demo/worker-count", 3};

std::mutex output_mutex;

void process_chunk(int chunk) {
    std::string line = "[" + scoped::ask(tenant) + "/" + scoped::ask(request_id) + "] chunk " +
                       std::to_string(chunk) + " done";
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << "\n";
}

void handle_request(int n) {
    int workers = scoped::ask(worker_count);
    SCOPED_LOG_INFO("demo", "Handling " << scoped::ask(request_id) << " with " << workers
                                        << " workers");

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    for (int chunk = 0; chunk < workers; ++chunk) {
        threads.emplace_back(scoped::bound_fn(process_chunk), n * 100 + chunk);
    }
    for (auto& t : threads) {
        t.join();
    }
}

int parse_request_count(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.empty() || arg[0] == '-') {
            continue;
        }
        int value = 0;
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
        if (ec == std::errc() && ptr == arg.data() + arg.size() && value > 0) {
            return value;
        }
        std::cerr << "warning: ignoring argument '" << arg << "'\n";
    }
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    scoped::log::Logger::init(scoped::log::parse_log_options(argc, argv));

    int requests = parse_request_count(argc, argv);
    std::cout << "scoped " << scoped::VERSION << " using the "
              << scoped::carrier_kind_name(scoped::global_carrier().kind()) << " carrier\n";

    for (int n = 1; n <= requests; ++n) {
        std::string id = "req-" + std::to_string(n);
        std::string who = n % 2 == 0 ? "acme" : "globex";
        scoped::scoping({scoped::bind(request_id, id), scoped::bind(tenant, who)},
                        [n] { handle_request(n); });
    }

    try {
        (void)scoped::ask(request_id);
    } catch (const scoped::UnboundError& e) {
        std::cout << "outside any request: " << e.what() << "\n";
    }
    return 0;
}
