#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将非法的 UTF-8 字节替换为 U+FFFD
 * 选手程序的输出可能不是合法的 UTF-8，而 JSON 序列化要求字符串必须合法
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 临时文件，析构时删除
 * 文件名由随机 UUID 生成，保证并发评测时不会冲突。
 * 删除失败时只记录日志，不抛出异常。
 */
struct scoped_temp_file {
    /**
     * @param dir 临时文件所在的文件夹，为空时使用系统临时文件夹
     * @param suffix 文件后缀，比如 ".py"
     */
    scoped_temp_file(const std::filesystem::path &dir, const std::string &suffix);
    scoped_temp_file(scoped_temp_file &&);
    scoped_temp_file(const scoped_temp_file &) = delete;
    ~scoped_temp_file();

    scoped_temp_file &operator=(scoped_temp_file &&);
    scoped_temp_file &operator=(const scoped_temp_file &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 覆盖写入文件内容
     * @throw launch_error 若写入失败
     */
    void write(const std::string &content) const;

    void release();

private:
    bool valid;
    std::filesystem::path file;
};

}  // namespace grader
