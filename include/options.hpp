#pragma once

#include <optional>
#include <string>
#include <vector>
#include "run_spec.hpp"

namespace runexec {

/**
 * @brief 以秒为单位的时间，必须是非负的有限数
 */
struct duration_option {
    double seconds = 0;
};

/**
 * @brief CPU 核心列表，格式为逗号分隔的编号或者区间，比如 "0,2-3"
 */
struct core_list {
    std::vector<int> ids;
};

/**
 * @brief 解析逗号分隔的核心列表
 * @throw boost::program_options::validation_error 格式不正确
 */
core_list parse_core_list(const std::string &text);

/**
 * @brief runexec 命令行参数
 */
struct runexec_options {
    run_spec spec;

    std::optional<std::string> user;

    bool debug = false;

    bool help = false;
    bool version = false;

    /**
     * @brief 参数说明，用于 --help 和参数错误时输出
     */
    std::string usage;
};

/**
 * @brief 解析命令行参数
 * @throw boost::program_options::error 参数不正确
 */
runexec_options parse_options(int argc, const char *const argv[]);

}  // namespace runexec
