#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 评测流程本身出错（而不是选手程序出错），该提交将被标记为 internal_error
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示创建子进程、读写管道、回收子进程时发生的系统调用错误
 */
struct process_error : public grader_exception {
    process_error(int err, const std::string &message);

    /**
     * @brief 出错时的 errno
     */
    int error_code() const noexcept;

private:
    int err;
};

/**
 * @brief 表示提交的代码文件不合法（扩展名不支持、文件过大或者文件不存在）
 * 由 submit 抛出，提交不会进入评测队列
 */
struct invalid_submission : public grader_exception {
    explicit invalid_submission(const std::string &message);
};

}  // namespace grader
