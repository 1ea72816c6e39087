/**
 * @file main.cpp
 * @brief 命令行评测入口
 *
 * 用法：
 *   sandjudge [-c engine.yaml] [-u user] [--custom [--input file]] <problem_id> <language> <source>
 *
 * 加载配置、启动工作线程池、提交一份源代码，把状态变化打印到控制台，
 * 最后输出判定。退出码：0 Accepted，1 其它判定，2 提交或配置错误。
 */

#include <iostream>
#include <mutex>
#include <condition_variable>

#include "sandjudge.h"

using namespace sj;

namespace {

struct Options {
    std::string config_path = "config/engine.yaml";
    std::string user_id = "cli";
    bool custom = false;
    std::string input_path;
    std::string problem_id;
    std::string language;
    std::string source_path;
};

void usage(const char *prog) {
    std::cerr << "Usage: " << prog
              << " [-c engine.yaml] [-u user] [--custom [--input file]] <problem_id> <language> <source>"
              << std::endl;
}

bool parse_args(int argc, char **argv, Options &opt) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            opt.user_id = argv[++i];
        } else if (arg == "--custom") {
            opt.custom = true;
        } else if (arg == "--input" && i + 1 < argc) {
            opt.input_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 3) {
        return false;
    }
    opt.problem_id = positional[0];
    opt.language = positional[1];
    opt.source_path = positional[2];
    return opt.input_path.empty() || opt.custom;
}

/**
 * @brief 打印状态变化，收到终态后唤醒主线程
 */
class ConsoleUpdateSink : public engine::UpdateSink {
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string submission_id_;
    bool done_ = false;

public:
    void watch(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        submission_id_ = id;
    }

    void on_update(const engine::StatusUpdate &u) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!submission_id_.empty() && u.submission_id != submission_id_) {
            return;
        }
        if (u.test_result) {
            const TestCaseResult &r = *u.test_result;
            std::cout << "  test #" << (*u.current_test_index + 1) << " " << verdict_kind_str(r.verdict_kind)
                      << " (" << r.execution_time_ms << " ms, " << r.memory_used_bytes / KiB << " KiB)"
                      << std::endl;
        } else {
            std::cout << "[" << submission_status_str(u.status) << "]" << std::endl;
        }
        if (is_terminal(u.status)) {
            done_ = true;
            cv_.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }
};

void print_verdict(const Submission &s) {
    std::cout << "Submission " << s.id << ": " << submission_status_str(s.status) << std::endl;
    if (s.strategy) {
        std::cout << "Strategy:  " << strategy_kind_str(s.strategy->kind) << " (" << s.strategy->rationale << ")"
                  << std::endl;
    }
    if (!s.verdict) {
        return;
    }
    const Verdict &v = *s.verdict;
    std::cout << "Verdict:   " << verdict_kind_str(v.status) << std::endl;
    std::cout << "Passed:    " << v.passed_tests << "/" << v.total_tests << std::endl;
    std::cout << "Max time:  " << v.max_time_ms << " ms" << std::endl;
    std::cout << "Max mem:   " << v.max_memory_bytes / KiB << " KiB" << std::endl;
    if (v.failed_test_case) {
        std::cout << "Failed at: test #" << *v.failed_test_case << std::endl;
    }
    if (v.error_message && !v.error_message->empty()) {
        std::cout << "Message:" << std::endl << *v.error_message << std::endl;
    }
    for (const auto &r : s.test_results) {
        if (r.actual_output && s.is_custom_test) {
            std::cout << "Output of " << r.test_case_id << ":" << std::endl << *r.actual_output << std::endl;
        }
    }
}

} // namespace

int main(int argc, char **argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        usage(argv[0]);
        return 2;
    }

    auto config = EngineConfig::load(opt.config_path);
    if (config.is_error()) {
        std::cerr << "Cannot load config: " << config.error().to_string() << std::endl;
        return 2;
    }
    const EngineConfig &cfg = config.value();
    init_engine(cfg);

    auto loaded = load_languages_from_directory(cfg.paths.languages, LanguageRegistry::instance());
    if (loaded.is_error()) {
        ELOG_ERROR << "Cannot load languages: " << loaded.error().to_string();
        return 2;
    }
    auto heuristics = router::HeuristicsTable::load(cfg.paths.heuristics);
    if (heuristics.is_error()) {
        ELOG_ERROR << "Cannot load heuristics: " << heuristics.error().to_string();
        return 2;
    }
    auto catalog = std::make_shared<engine::YamlProblemCatalog>();
    auto problems = catalog->load_directory(cfg.paths.problems);
    if (problems.is_error()) {
        ELOG_ERROR << "Cannot load problems: " << problems.error().to_string();
        return 2;
    }
    auto code = read_file(opt.source_path);
    if (code.is_error()) {
        ELOG_ERROR << code.error().to_string();
        return 2;
    }

    auto factory = std::make_shared<engine::ProcessSandboxFactory>(LanguageRegistry::instance(), cfg.isolation,
                                                                   cfg.paths.scratch_root);
    engine::ServiceDeps deps;
    deps.heuristics = heuristics.value();
    deps.catalog = catalog;
    deps.sandbox_factory = [factory](const std::string &id, const std::string &language,
                                     sandbox::SandboxKind kind) { return (*factory)(id, language, kind); };

    engine::JudgeService service(cfg, LanguageRegistry::instance(), std::move(deps));
    auto sink = std::make_shared<ConsoleUpdateSink>();
    service.subscribe(opt.user_id, sink);
    service.start();

    engine::SubmissionRequest req;
    req.code = code.value();
    req.language = opt.language;
    req.problem_id = opt.problem_id;
    req.user_id = opt.user_id;
    req.is_custom_test = opt.custom;
    if (!opt.input_path.empty()) {
        auto input = read_file(opt.input_path);
        if (input.is_error()) {
            ELOG_ERROR << input.error().to_string();
            return 2;
        }
        req.custom_input = input.value();
    }

    auto id = service.submit(req);
    if (id.is_error()) {
        std::cerr << "Rejected: " << id.error().to_string() << std::endl;
        return 2;
    }
    sink->watch(id.value());
    sink->wait();

    auto result = service.get_submission(id.value());
    service.stop();
    engine_log().flush_all();
    if (result.is_error()) {
        std::cerr << result.error().to_string() << std::endl;
        return 2;
    }
    print_verdict(result.value());
    return result.value().verdict && result.value().verdict->accepted() ? 0 : 1;
}
