#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw process_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 截断过长的文本，避免恶意提交输出大量错误信息
 * @param text 要截断的文本
 * @param limit 最多保留多少字节，超出部分替换为提示信息
 */
std::string truncate_text(const std::string &text, std::size_t limit);

/**
 * @brief 去除字符串末尾的空白字符
 */
std::string trim_right(const std::string &text);

}  // namespace grader
