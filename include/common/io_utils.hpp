#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文本文件，文件已存在时覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 按文件名排序列出文件夹内所有不以 . 开头的项
 * @param dir 要被列出的文件夹，不存在时返回空列表
 */
std::vector<std::filesystem::path> list_visible_entries(const std::filesystem::path &dir);

/**
 * @brief 在 parent 下创建一个随机命名的临时文件夹，析构时删除
 * 删除失败只会记录日志，不会抛出异常。
 * 只能移动，不能复制。
 */
struct scoped_temp_directory {
    scoped_temp_directory();
    scoped_temp_directory(const std::filesystem::path &parent, const std::string &prefix);
    scoped_temp_directory(scoped_temp_directory &&);
    ~scoped_temp_directory();

    scoped_temp_directory &operator=(scoped_temp_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 保留文件夹，析构时不再删除，供调试时检查文件
     */
    void keep();

    void release();

private:
    bool valid;
    std::filesystem::path dir;
};

}  // namespace codebench
