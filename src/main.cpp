#include "fluxbin/Job.hpp"
#include "fluxbin/JsonUtils.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <iostream>

using namespace fluxbin;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("fluxbin", "Flux-conserving rebinning of tabulated spectra");
        opts.add_options()
            ("job", "Job configuration JSON", cxxopts::value<std::string>())
            ("threads", "Number of threads (overrides job file)", cxxopts::value<unsigned>())
            ("backend", "auto | sequential | openmp | threadpool", cxxopts::value<std::string>())
            ("v,verbose", "Print per-file details")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("job")) {
            std::cout << opts.help() << '\n';
            return 0;
        }
        const bool verbose = cli.count("verbose") > 0;

        auto job_json = load_json(cli["job"].as<std::string>());
        expand_env(job_json);
        JobConfig job = parse_job(job_json);

        if (cli.count("threads")) job.execution.threads = cli["threads"].as<unsigned>();
        if (cli.count("backend")) job.execution.backend = backend_from_string(cli["backend"].as<std::string>());

        std::cout << "[fluxbin] backend: " << to_string(resolve_backend(job.execution))
                  << ", threads: " << resolve_threads(job.execution) << '\n';

        const JobReport report = run_job(job, verbose);
        std::cout << "[fluxbin] " << report.outputs.size() << " spectra in "
                  << report.n_groups << " grid group(s) written to " << job.output_dir << '\n';

        std::cout << "\nRebinning completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "Took: " << duration << " ms\n";

    return 0;
}
