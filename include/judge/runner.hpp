#pragma once

#include <filesystem>
#include "config.hpp"
#include "judge/report.hpp"
#include "judge/test_case.hpp"

namespace grader {

/**
 * @brief 运行选手程序的一个测试点
 *
 * 选手程序在 executable 所在的文件夹中运行，输入数据通过 stdin 喂入，
 * 收集 stdout 和 stderr。判定顺序为：
 * 1. 超出时钟时间限制：杀死进程组，time limit exceeded，不采用超时前的输出
 * 2. 峰值常驻内存超出内存限制：memory limit exceeded，无论输出是否正确
 * 3. stdout 超过 output_limit：output limit exceeded，被截断的输出不参与比较
 * 4. 返回非零值或被信号杀死：runtime error，附带返回值和截断的 stderr
 * 5. 否则 result 为 PASS，output 保存去除末尾空白的 stdout，由调用方交给 compare 判定
 *
 * @note 内存统计是程序结束后由内核给出的峰值常驻内存，只是近似值。
 * 程序运行期间不会因为内存超限被终止，无法获得时视为 0。
 *
 * 运行过程中的任何异常都会被转换为失败的测试点结果，不会向外抛出。
 *
 * @param testcase 要运行的测试点
 * @param executable 编译好的选手程序
 * @param limits 评测限制
 * @return 测试点结果
 */
test_outcome run_test_case(const test_case &testcase, const std::filesystem::path &executable, const limits_policy &limits);

}  // namespace grader
