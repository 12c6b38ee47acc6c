#pragma once

#include <map>
#include <string>
#include <vector>
#include "exit_status.hpp"

namespace runexec {

/**
 * @brief 通过 sudo 以另一个用户的身份运行被测命令
 * 构造时检查用户是否存在，以及 sudo --non-interactive 是否可以切换到该用户，
 * 因此配置错误总是在创建子进程之前被发现。
 *
 * 由于 sudo 会重置环境变量，环境变量通过 env 命令传递给目标命令。
 * 由于被测进程属于另一个用户，发送信号也需要通过 sudo 完成。
 */
struct privilege_elevation {
    /**
     * @param user 用户名，或者 "#uid"
     * @throw configuration_error 用户不存在或者 sudo 无法切换到该用户
     */
    explicit privilege_elevation(const std::string &user);

    const std::string &user() const;

    /**
     * @brief 生成实际执行的命令行：sudo --non-interactive -u <user> -- [env K=V ...] <command>
     */
    std::vector<std::string> wrap(const std::vector<std::string> &command,
                                  const std::map<std::string, std::string> &environment) const;

    /**
     * @brief 以目标用户身份向整个进程组发送信号
     * @return 信号是否发送成功，进程组已经不存在时也返回 true
     */
    bool kill(int pgid, int signal) const;

    /**
     * @brief 将 sudo 进程的 wait 状态翻译为目标进程的状态
     */
    exit_status translate(int raw) const;

private:
    std::string username;
};

}  // namespace runexec
