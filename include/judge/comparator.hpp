#pragma once

#include <string>

namespace grader {

/**
 * @brief 比较选手输出和标准输出
 * 两边都去除首尾空白字符后进行精确比较，不支持浮点误差和部分分。
 * 空的标准输出只和（去除空白后）空的选手输出相等。
 * @param actual 选手程序的输出
 * @param expected 标准输出
 * @return true 若输出一致
 */
bool compare(const std::string &actual, const std::string &expected);

}  // namespace grader
