#pragma once

#include <optional>
#include <string>

namespace runexec {

/**
 * @brief 进程的结束状态
 * 一个进程要么正常退出并带有返回值 value，要么被信号 signal 终止，不会同时出现两者。
 * raw 保存 wait 得到的原始状态，在结果中以 exitcode 输出。
 */
struct exit_status {
    /**
     * @brief wait() 得到的原始状态
     * 在使用 sudo 时，这是 sudo 进程自身的状态
     */
    int raw = 0;

    /**
     * @brief 进程的返回值，被信号终止时为 0
     */
    int value = 0;

    /**
     * @brief 终止进程的信号，正常退出时为空
     */
    std::optional<int> signal;

    bool core_dumped = false;

    /**
     * @brief 按照 POSIX wait status 的格式解码
     * @throw internal_error 当 raw 既不是退出也不是信号终止时
     */
    static exit_status from_raw(int raw);

    /**
     * @brief 解码通过 sudo 等提权工具运行的进程状态
     * 提权工具会转发杀死目标进程的信号，因此 raw 的信号位非零时直接按 from_raw 解码。
     * 信号位为零时，提权工具自身正常退出，它的返回值 raw >> 8 需要重新解释：
     * 第 0-6 位是目标进程的信号（0 表示没有），第 8-14 位是目标进程真正的返回值，core dump 位被清除。
     */
    static exit_status from_elevated_raw(int raw);

    /**
     * @brief 按照提权工具的格式打包 (value, signal)，是 from_elevated_raw 的逆运算
     * 结果中提权工具自身的信号位总是为零
     */
    static int encode_elevated(int value, int signal);

    static exit_status exited(int value);

    static exit_status signaled(int signal, bool core_dumped = false);

    /**
     * @brief 重新编码为 POSIX wait status
     */
    int to_raw() const;

    bool operator==(const exit_status &other) const;
    bool operator!=(const exit_status &other) const;
};

std::string to_string(const exit_status &status);

}  // namespace runexec
