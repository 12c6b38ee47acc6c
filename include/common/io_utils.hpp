#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace runexec {

/**
 * @brief 日志文件过大被删减时，插入在保留的头部与尾部之间的提示
 */
extern const std::string LOG_REDUCED_MARKER;

/**
 * @brief 删减后的文件允许超过限制的字节数（即 LOG_REDUCED_MARKER 的预留空间）
 */
constexpr std::size_t LOG_REDUCED_OVERHEAD = 100;

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
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将文件缩减到大约 limit 字节
 * 只删除文件中间的若干整行，文件的开头和结尾保持不变，中间插入 LOG_REDUCED_MARKER。
 * 保留的头部在 limit/2 之后的第一个换行处结束，尾部从 size - limit/2 之后的第一个换行处开始，
 * 因此不会截断任何一行：超过 limit 的长行会被完整保留，这时结果可能大于 limit。
 * 文件大小不超过 limit 时不做任何修改。
 *
 * @param file 要缩减的文件
 * @param limit 目标大小（字节）
 * @param min_prefix 头部至少保留的字节数，用于保护日志文件的头部
 * @return 文件是否被修改
 * @throw std::system_error 当文件无法读写时
 */
bool reduce_file_size(const std::filesystem::path &file, std::size_t limit, std::size_t min_prefix = 0);

}  // namespace runexec
