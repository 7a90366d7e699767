/**
 * @file runner.h
 * @brief 受测程序运行器
 *
 * CandidateRunner 把一次运行的各种结局折叠成 RunOutcome：
 * - 退出码 0 → AC
 * - 退出码非 0 或被信号终止 → RE，诊断信息为 stderr
 * - 超时 → TLE，输出为被杀之前捕获的部分
 * - 无法启动 → RE，诊断信息为失败原因，用时 0
 *
 * run_with_repeat 负责重复运行以获得稳定的用时。
 */

#ifndef OJT_CORE_RUNNER_H
#define OJT_CORE_RUNNER_H

#include <string>
#include <vector>
#include <cstring>
#include <signal.h>
#include "core/types.h"
#include "core/utils.h"
#include "core/guard.h"
#include "core/logger.h"
#include "sandbox/process.h"

namespace ojt {

/**
 * @brief 受测程序：可执行文件路径及其工作目录
 */
struct Candidate {
    std::string program;
    std::vector<std::string> args;
    std::string work_dir;
};

class CandidateRunner {
private:
    Candidate candidate_;

    static std::string signal_note(int sig) {
        const char *name = strsignal(sig);
        return "Killed by signal " + std::to_string(sig) +
               (name ? " (" + std::string(name) + ")" : "");
    }

public:
    explicit CandidateRunner(Candidate candidate) : candidate_(std::move(candidate)) {}

    const Candidate& candidate() const { return candidate_; }

    /**
     * @brief 运行一次
     * @param input 写入标准输入的全部内容
     * @param time_limit_ms 墙上时间限制（毫秒，可以带小数）
     */
    RunOutcome run(const std::string &input, double time_limit_ms) const {
        sandbox::ProcessConfig cfg;
        cfg.program = candidate_.program;
        cfg.args = candidate_.args;
        cfg.work_dir = candidate_.work_dir;
        cfg.time_limit_ms = time_limit_ms;
        cfg.env.push_back({CHILD_MARKER_ENV, CHILD_MARKER_VALUE});

        sandbox::Process process(cfg);
        auto result = process.run(input);
        if (result.is_error()) {
            OJT_LOG_DEBUG << "Spawn failed: " << result.error().to_string();
            return RunOutcome(Status::RE, "", 0, result.error().message());
        }

        const sandbox::ProcessResult &r = result.value();
        std::string output = decode_text(r.stdout_data);
        OJT_LOG_DEBUG << "Attempt finished: " << sandbox::exit_kind_to_string(r.kind)
                      << " exit_code=" << r.exit_code << " time=" << format_ms(r.elapsed_ms) << "ms";

        switch (r.kind) {
            case sandbox::ExitKind::TIMED_OUT:
                return RunOutcome(Status::TLE, output, r.elapsed_ms, "");
            case sandbox::ExitKind::SIGNALED: {
                std::string diag = decode_text(r.stderr_data);
                if (!diag.empty() && diag.back() != '\n') {
                    diag += '\n';
                }
                diag += signal_note(r.signal);
                return RunOutcome(Status::RE, output, r.elapsed_ms, diag);
            }
            case sandbox::ExitKind::EXITED:
                break;
        }
        if (r.exit_code != 0) {
            return RunOutcome(Status::RE, output, r.elapsed_ms, decode_text(r.stderr_data));
        }
        return RunOutcome(Status::AC, output, r.elapsed_ms, "");
    }

    /**
     * @brief 重复运行 repeat 次，遇到第一个非 AC 立即停止
     *
     * 每次的用时都会记录；全部 AC 时返回最后一次的输出。
     * repeat 必须 >= 1，由调用者保证。
     */
    RepeatOutcome run_with_repeat(const std::string &input, double time_limit_ms, int repeat) const {
        RepeatOutcome out;
        for (int i = 0; i < repeat; i++) {
            RunOutcome once = run(input, time_limit_ms);
            out.times.push_back(once.elapsed_ms);
            out.status = once.status;
            out.output = std::move(once.output);
            out.diagnostic = std::move(once.diagnostic);
            if (out.status != Status::AC) {
                break;
            }
        }
        return out;
    }
};

} // namespace ojt

#endif // OJT_CORE_RUNNER_H
