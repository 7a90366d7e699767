/**
 * @file main_tester.cpp
 * @brief 命令行入口
 *
 * 用法：oj_tester [options] <program> [case ...]
 *
 * 全部测资跑完即返回 0，与各测资的结果无关；
 * 参数错误、找不到目标程序或测资时返回 1。
 */

#include <getopt.h>
#include <iostream>
#include <sstream>
#include "oj_tester.h"

using namespace ojt;

namespace {

enum OptionId {
    OPT_DIR = 'd',
    OPT_TIME = 't',
    OPT_STRICT = 's',
    OPT_REPEAT = 'r',
    OPT_CASES = 'c',
    OPT_HELP = 'h',
    OPT_RAW = 256,
    OPT_NO_COMPARE,
    OPT_MAX_DIFFS,
    OPT_SHOW_MISSING,
    OPT_CONFIG,
    OPT_LOG_LEVEL,
    OPT_LOG_FILE
};

const char *USAGE =
    "Usage: oj_tester [options] <program> [case ...]\n"
    "\n"
    "Runs <program> on every <name>.in in the test case directory and compares\n"
    "its output with <name>.out.\n"
    "\n"
    "Options:\n"
    "  -d, --dir DIR          test case directory (default: <program dir>/test_case)\n"
    "  -t, --time MS          time limit per run in milliseconds (default 3000)\n"
    "  -s, --strict           exact line comparison\n"
    "  -r, --repeat N         runs per case (default 1)\n"
    "  -c, --cases LIST       comma separated case selectors (numbers or substrings)\n"
    "      --raw              always print the program output\n"
    "      --no-compare       do not compare with .out files\n"
    "      --max-diffs N|none number of differing lines shown (default 10)\n"
    "      --show-missing     print the output when the .out file is missing\n"
    "      --config FILE      read options from a 'key value' file first\n"
    "      --log-level LEVEL  trace|debug|info|warn|error|fatal|off\n"
    "      --log-file FILE    also write logs to FILE\n"
    "  -h, --help             show this help\n";

void split_cases(const std::string &list, std::vector<FilterToken> &out) {
    std::stringstream ss(list);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (!token.empty()) {
            out.push_back(parse_token(token));
        }
    }
}

struct CommandLine {
    std::string program;
    TesterOptions options;
};

/**
 * @brief 解析命令行；--config 的内容先加载，其余参数覆盖它
 */
Result<CommandLine> parse_arguments(int argc, char **argv) {
    static const struct option long_options[] = {
        {"dir",          required_argument, nullptr, OPT_DIR},
        {"time",         required_argument, nullptr, OPT_TIME},
        {"strict",       no_argument,       nullptr, OPT_STRICT},
        {"repeat",       required_argument, nullptr, OPT_REPEAT},
        {"cases",        required_argument, nullptr, OPT_CASES},
        {"raw",          no_argument,       nullptr, OPT_RAW},
        {"no-compare",   no_argument,       nullptr, OPT_NO_COMPARE},
        {"max-diffs",    required_argument, nullptr, OPT_MAX_DIFFS},
        {"show-missing", no_argument,       nullptr, OPT_SHOW_MISSING},
        {"config",       required_argument, nullptr, OPT_CONFIG},
        {"log-level",    required_argument, nullptr, OPT_LOG_LEVEL},
        {"log-file",     required_argument, nullptr, OPT_LOG_FILE},
        {"help",         no_argument,       nullptr, OPT_HELP},
        {nullptr, 0, nullptr, 0}
    };
    const char *short_options = "+d:t:sr:c:h";

    // 第一遍只处理 --config 和日志选项
    Config config;
    int opt;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, short_options, long_options, nullptr)) != -1) {
        switch (opt) {
            case OPT_CONFIG:
                OJT_TRY(config.load(optarg));
                break;
            case OPT_LOG_LEVEL: {
                auto level = level_from_string(optarg);
                OJT_ENSURE(level.has_value(), ErrorCode::CONFIG_INVALID_VALUE,
                           std::string("Unknown log level: ") + optarg);
                OJT_LOG_SET_LEVEL(*level);
                default_logger().show_location(*level <= LogLevel::DEBUG);
                break;
            }
            case OPT_LOG_FILE:
                OJT_ENSURE(default_logger().add_file(optarg), ErrorCode::FILE_NOT_FOUND,
                           std::string("Cannot open log file ") + optarg);
                break;
            case OPT_HELP:
                std::cout << USAGE;
                exit(0);
            case '?':
                return Err<CommandLine>(ErrorCode::CONFIG_PARSE_ERROR,
                    std::string("Unknown or incomplete option: ") + argv[optind - 1]);
            default:
                break;
        }
    }

    OJT_TRY_UNWRAP(options, TesterOptions::from_config(config));
    CommandLine cmd;
    cmd.options = std::move(options);
    TesterOptions &o = cmd.options;

    optind = 0;  // glibc: 0 表示重新初始化扫描
    while ((opt = getopt_long(argc, argv, short_options, long_options, nullptr)) != -1) {
        Config single;
        switch (opt) {
            case OPT_DIR:
                o.test_case_dir = optarg;
                break;
            case OPT_TIME: {
                single.set("time_limit", optarg);
                OJT_TRY_UNWRAP(ms, single.get_int("time_limit", o.time_limit_ms));
                OJT_ENSURE(ms > 0 && ms <= INT32_MAX, ErrorCode::CONFIG_INVALID_VALUE,
                           std::string("Invalid time limit: ") + optarg);
                o.time_limit_ms = static_cast<int>(ms);
                break;
            }
            case OPT_STRICT:
                o.strict_comparison = true;
                break;
            case OPT_REPEAT: {
                single.set("repeat", optarg);
                OJT_TRY_UNWRAP(n, single.get_int("repeat", o.repeat));
                OJT_ENSURE(n >= 1 && n <= INT32_MAX, ErrorCode::CONFIG_INVALID_VALUE,
                           std::string("Invalid repeat count: ") + optarg);
                o.repeat = static_cast<int>(n);
                break;
            }
            case OPT_CASES:
                split_cases(optarg, o.cases);
                break;
            case OPT_RAW:
                o.show_raw_output = true;
                break;
            case OPT_NO_COMPARE:
                o.compare_output = false;
                break;
            case OPT_MAX_DIFFS: {
                OJT_TRY_UNWRAP(max_diffs, TesterOptions::parse_max_diffs(optarg));
                o.max_diffs = max_diffs;
                break;
            }
            case OPT_SHOW_MISSING:
                o.show_missing_output = true;
                break;
            default:
                break;
        }
    }

    OJT_ENSURE(optind < argc, ErrorCode::CONFIG_PARSE_ERROR, "Missing target program");
    cmd.program = argv[optind++];
    for (; optind < argc; optind++) {
        split_cases(argv[optind], o.cases);
    }
    return cmd;
}

} // namespace

int main(int argc, char **argv) {
    auto cmd = parse_arguments(argc, argv);
    if (!cmd.ok()) {
        std::cerr << "Error: " << cmd.error().message() << "\n\n" << USAGE;
        return 1;
    }

    auto tester = OnlineJudgeTester::create(cmd.value().program, cmd.value().options);
    if (!tester.ok()) {
        std::cerr << "Error: " << tester.error().message() << std::endl;
        return 1;
    }

    // 独立运行时受测程序是另一个可执行文件，不需要解题函数
    auto results = tester.value().run_tests();
    if (!results.ok()) {
        OJT_LOG_DEBUG << results.error().to_string();
        std::cerr << "Error: " << results.error().message() << std::endl;
        return 1;
    }
    default_logger().flush();
    return 0;
}
