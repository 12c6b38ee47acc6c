#pragma once

#include <string>

namespace runexec {

/**
 * @brief 根据用户名查找 uid
 * @return uid，用户不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 解析 sudo 风格的用户标识：用户名或者 "#uid"
 * @return uid，无法解析或者用户不存在时返回 -1
 */
int resolve_user(const std::string &user);

bool is_integer(const std::string &s);

}  // namespace runexec
