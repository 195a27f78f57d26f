#include "core/config.h"
#include "core/errors.h"
#include "engine/orchestrator.h"
#include "engine/result_json.h"
#include "logging/chain.h"
#include "modules/builtin.h"
#include <schema/scan_result.h>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void print_summary(const ScanResult& result) {
    ScanSummary s = result.summary();
    std::cout << "Pages crawled: " << result.pages.size()
              << " (" << result.cache_hits << " from cache, "
              << result.robots_blocked << " blocked by robots.txt)\n";
    std::cout << "Findings: " << s.total()
              << " (critical " << s.critical << ", high " << s.high
              << ", medium " << s.medium << ", low " << s.low << ", info " << s.info << ")\n";
    for (const auto& m : result.module_results) {
        std::cout << "  " << m.name << ": " << module_status_to_string(m.status);
        if (m.status == ModuleStatus::ERROR) {
            std::cout << " (" << m.error << ")";
        } else {
            std::cout << ", " << m.findings.size() << " finding(s)";
        }
        std::cout << "\n";
    }
    if (result.partial) {
        std::cout << "Scan deadline reached; results are partial.\n";
    }
}

} // namespace

/**
 * @brief Run a scan from a configuration file and/or command-line target
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 when no critical or high findings, 1 when there are some,
 *         2 for usage or setup errors
 */
int run_scan(int argc, char** argv) {
    std::string config_path;
    std::string target;
    std::string outfile;
    std::string openapi;
    std::string profile;
    std::string module_list;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--target" && i + 1 < argc) {
            target = argv[++i];
        } else if (a == "--out" && i + 1 < argc) {
            outfile = argv[++i];
        } else if (a == "--openapi" && i + 1 < argc) {
            openapi = argv[++i];
        } else if (a == "--profile" && i + 1 < argc) {
            profile = argv[++i];
        } else if (a == "--modules" && i + 1 < argc) {
            module_list = argv[++i];
        } else {
            std::cerr << "Error: unexpected argument " << a << "\n";
            return 2;
        }
    }

    if (config_path.empty() && target.empty()) {
        std::cerr << "Error: --config or --target required\n";
        return 2;
    }

    ScanResult result;
    try {
        ScanConfig cfg = config_path.empty()
            ? config::from_json(nlohmann::json{{"target", target}})
            : config::load_file(config_path);
        if (!target.empty()) {
            cfg.target = target;
            cfg.base_url.clear();
            cfg.crawl.allowed_domains.clear();
        }
        if (!openapi.empty()) cfg.openapi_path = openapi;
        if (!profile.empty()) cfg.profile = profile;
        if (!module_list.empty()) cfg.modules = split_list(module_list);
        config::validate(cfg);

        engine::Orchestrator orchestrator(cfg, modules::builtin_registry(),
                                          engine::Services::from_config(cfg));
        std::cout << "Starting scan: " << orchestrator.run_id() << "\n";
        std::cout << "Target: " << cfg.target << "\n";
        result = orchestrator.run();
    } catch (const SetupError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::string report = engine::to_json(result).dump(2);
    if (outfile.empty()) {
        std::cout << report << "\n";
    } else {
        std::filesystem::path p(outfile);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        std::ofstream ofs(outfile);
        if (!ofs) {
            std::cerr << "Error: cannot write " << outfile << "\n";
            return 2;
        }
        ofs << report << "\n";
        std::cout << "Report written to " << outfile << "\n";
    }

    print_summary(result);
    ScanSummary s = result.summary();
    return (s.critical > 0 || s.high > 0) ? 1 : 0;
}

/**
 * @brief Verifies the integrity of a JSONL audit log
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: sitecheck verify <log-file.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    std::string error;
    if (logging::ChainLogger::verify(log_path, error)) {
        std::cout << "OK\n";
        return 0;
    }
    std::cerr << "Verification failed: " << error << "\n";
    return 1;
}

/**
 * @brief Lists built-in modules and profiles
 */
int cmd_modules() {
    engine::Registry registry = modules::builtin_registry();
    std::cout << "Modules:\n";
    for (const auto& name : registry.names()) {
        auto module = registry.create(name);
        std::cout << "  " << name << " [" << category_to_string(module->category()) << "] "
                  << module->description() << "\n";
    }
    std::cout << "Profiles:\n";
    for (const auto& profile : registry.profiles()) {
        std::cout << "  " << profile << ":";
        for (const auto& name : registry.resolve({}, profile)) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  sitecheck scan [--config FILE] [--target URL] [--out FILE] [--openapi FILE]\n";
        std::cerr << "                 [--profile NAME] [--modules a,b,c]\n";
        std::cerr << "  sitecheck verify <log-file.jsonl>\n";
        std::cerr << "  sitecheck modules\n";
        return 2;
    }

    std::string command = argv[1];

    if (command == "scan") {
        return run_scan(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else if (command == "modules") {
        return cmd_modules();
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }
}
