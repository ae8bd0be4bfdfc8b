#pragma once

#include <filesystem>
#include <string>

namespace engine {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw io_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @param path 文件路径，其父文件夹必须已经存在
 * @throw io_error 文件无法创建或写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 删除文件，文件不存在时什么也不做
 * @return 是否真的删除了文件
 * @throw io_error 文件存在但无法删除
 */
bool remove_if_exists(const std::filesystem::path &path);

bool utf8_check_is_valid(const std::string &string);

}  // namespace engine
