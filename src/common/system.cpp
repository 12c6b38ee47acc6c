#include "common/system.hpp"
#include <errno.h>
#include <pwd.h>
#include <sys/types.h>
#include <algorithm>
#include <boost/lexical_cast.hpp>

namespace runexec {
using namespace std;

int get_userid(const char *name) {
    struct passwd *pwd;

    errno = 0;
    pwd = getpwnam(name);

    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int resolve_user(const string &user) {
    if (user.size() > 1 && user[0] == '#') {
        string id = user.substr(1);
        if (!is_integer(id)) return -1;
        try {
            return boost::lexical_cast<int>(id);
        } catch (boost::bad_lexical_cast &) {
            return -1;
        }
    }
    return get_userid(user.c_str());
}

bool is_integer(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

}  // namespace runexec
