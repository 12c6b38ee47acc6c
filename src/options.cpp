#include "options.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <regex>
#include <sstream>

namespace runexec {
using namespace std;
namespace po = boost::program_options;

void validate(boost::any &v, const vector<string> &values, duration_option *, int) {
    po::validators::check_first_occurrence(v);

    string const &s = po::validators::get_single_string(values);
    duration_option result;
    try {
        result.seconds = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast &) {
        throw po::validation_error(po::validation_error::invalid_option_value);
    }
    if (!isfinite(result.seconds) || result.seconds < 0)
        throw po::validation_error(po::validation_error::invalid_option_value);

    v = result;
}

core_list parse_core_list(const string &text) {
    static const regex matcher("^([0-9]+)(-([0-9]+))?$");

    core_list result;
    vector<string> splitted;
    boost::split(splitted, text, boost::is_any_of(","));
    for (auto &token : splitted) {
        smatch matches;
        if (!regex_search(token, matches, matcher))
            throw po::validation_error(po::validation_error::invalid_option_value);

        try {
            if (matches[3].str().empty()) {
                result.ids.push_back(boost::lexical_cast<int>(matches[1].str()));
            } else {
                int begin = boost::lexical_cast<int>(matches[1].str());
                int end = boost::lexical_cast<int>(matches[3].str());
                if (begin > end)
                    throw po::validation_error(po::validation_error::invalid_option_value);
                for (int i = begin; i <= end; ++i) result.ids.push_back(i);
            }
        } catch (boost::bad_lexical_cast &) {
            // 数字太大
            throw po::validation_error(po::validation_error::invalid_option_value);
        }
    }
    return result;
}

void validate(boost::any &v, const vector<string> &values, core_list *, int) {
    po::validators::check_first_occurrence(v);
    v = parse_core_list(po::validators::get_single_string(values));
}

runexec_options parse_options(int argc, const char *const argv[]) {
    po::options_description desc("runexec options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("input", po::value<string>(), "redirect standard input of the command from file, or '-' to inherit the standard input of runexec (default: /dev/null)")
        ("output", po::value<string>()->default_value("output.log"), "write command line and output of the command to file")
        ("maxOutputSize", po::value<size_t>(), "shrink the output file to approximately this size in bytes by removing lines in the middle")
        ("timelimit", po::value<duration_option>(), "hard CPU time limit in seconds (floating point is acceptable)")
        ("softtimelimit", po::value<duration_option>(), "soft CPU time limit in seconds, the command receives SIGTERM when it is exceeded")
        ("walltimelimit", po::value<duration_option>(), "wall time limit in seconds")
        ("memlimit", po::value<int64_t>(), "memory limit in bytes")
        ("cores", po::value<core_list>(), "the CPU cores the command may use (e.g. \"0,2-3\")")
        ("user", po::value<string>(), "execute the command as user (user name or #uid) using sudo")
        ("dir", po::value<string>(), "working directory of the command")
        ("env", po::value<vector<string>>()->composing(), "set environment variable of the command (e.g. --env KEY=VALUE), can be given multiple times")
        ("debug", "keep killed logs and print more diagnostic output")
        ("cmd", po::value<vector<string>>()->composing(), "command to execute")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);

    runexec_options opt;
    {
        ostringstream ss;
        ss << desc;
        opt.usage = ss.str();
    }

    if (vm.count("help")) {
        opt.help = true;
        return opt;
    }
    if (vm.count("version")) {
        opt.version = true;
        return opt;
    }

    if (!vm.count("cmd"))
        throw po::required_option("cmd");
    opt.spec.command = vm["cmd"].as<vector<string>>();
    opt.spec.output_path = vm["output"].as<string>();

    if (vm.count("input")) {
        string input = vm["input"].as<string>();
        if (input == "-")
            opt.spec.input = input_source::inherit();
        else
            opt.spec.input = input_source::from_file(input);
    }

    if (vm.count("maxOutputSize")) opt.spec.max_output_size = vm["maxOutputSize"].as<size_t>();
    if (vm.count("timelimit")) opt.spec.limits.hard_cpu_time = vm["timelimit"].as<duration_option>().seconds;
    if (vm.count("softtimelimit")) opt.spec.limits.soft_cpu_time = vm["softtimelimit"].as<duration_option>().seconds;
    if (vm.count("walltimelimit")) opt.spec.limits.wall_time = vm["walltimelimit"].as<duration_option>().seconds;
    if (vm.count("memlimit")) opt.spec.limits.memory = vm["memlimit"].as<int64_t>();
    if (vm.count("cores")) opt.spec.limits.cores = vm["cores"].as<core_list>().ids;
    if (vm.count("user")) opt.user = vm["user"].as<string>();
    if (vm.count("dir")) opt.spec.work_dir = vm["dir"].as<string>();
    if (vm.count("debug")) opt.debug = true;

    if (vm.count("env")) {
        for (auto &variable : vm["env"].as<vector<string>>()) {
            auto idx = variable.find('=');
            if (idx == string::npos || idx == 0)
                throw po::invalid_option_value(variable);
            opt.spec.environment[variable.substr(0, idx)] = variable.substr(idx + 1);
        }
    }

    return opt;
}

}  // namespace runexec
