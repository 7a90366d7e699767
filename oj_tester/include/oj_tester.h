/**
 * @file oj_tester.h
 * @brief 本地 OJ 测试器主头文件
 * 
 * 使用方式（嵌入模式）：
 *   #include "oj_tester.h"
 *   
 *   void solve() { ... 从 stdin 读、向 stdout 写 ... }
 *   
 *   int main(int argc, char **argv) {
 *       auto tester = ojt::OnlineJudgeTester::create("/proc/self/exe");
 *       tester.value().run_tests(solve);  // 子进程中只运行 solve
 *   }
 */

#ifndef OJT_OJ_TESTER_H
#define OJT_OJ_TESTER_H

#include "core/types.h"
#include "core/error.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/case_store.h"
#include "core/comparator.h"
#include "core/guard.h"
#include "core/runner.h"
#include "core/reporter.h"
#include "core/tester.h"

#include "sandbox/process.h"

#endif // OJT_OJ_TESTER_H
