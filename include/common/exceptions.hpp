#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示无法启动或监控评测进程
 * 比如创建管道、fork、写入临时文件失败
 */
struct launch_error : public grader_exception {
    launch_error();
    explicit launch_error(const std::string &message);
};

/**
 * @brief 表示配置文件格式不正确
 */
struct config_error : public grader_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace grader
