#include <boost/program_options/errors.hpp>
#include "gtest/gtest.h"
#include "options.hpp"

using namespace std;
using namespace runexec;

static runexec_options parse(vector<const char *> args) {
    args.insert(args.begin(), "runexec");
    return parse_options((int)args.size(), args.data());
}

TEST(OptionsTest, CommandAfterSeparator) {
    auto opt = parse({"--timelimit", "1.5", "--", "sh", "-c", "echo --timelimit"});
    ASSERT_EQ(opt.spec.command.size(), 3u);
    EXPECT_EQ(opt.spec.command[0], "sh");
    EXPECT_EQ(opt.spec.command[2], "echo --timelimit");
    EXPECT_DOUBLE_EQ(*opt.spec.limits.hard_cpu_time, 1.5);
    EXPECT_EQ(opt.spec.output_path.string(), "output.log");
    EXPECT_EQ(opt.spec.input.type, input_source::kind::null_device);
    EXPECT_FALSE(opt.user);
}

TEST(OptionsTest, AllOptions) {
    auto opt = parse({"--input", "-", "--output", "run.log", "--maxOutputSize", "1000",
                      "--softtimelimit", "1", "--timelimit", "2", "--walltimelimit", "3",
                      "--memlimit", "1048576", "--cores", "0,2-3", "--user", "#1000",
                      "--dir", "/tmp", "--env", "A=1", "--env", "B=x=y", "--debug", "--", "true"});
    EXPECT_EQ(opt.spec.input.type, input_source::kind::inherit);
    EXPECT_EQ(opt.spec.output_path.string(), "run.log");
    EXPECT_EQ(opt.spec.max_output_size, 1000u);
    EXPECT_DOUBLE_EQ(*opt.spec.limits.soft_cpu_time, 1);
    EXPECT_DOUBLE_EQ(*opt.spec.limits.hard_cpu_time, 2);
    EXPECT_DOUBLE_EQ(*opt.spec.limits.wall_time, 3);
    EXPECT_EQ(opt.spec.limits.memory, 1048576);
    EXPECT_EQ(opt.spec.limits.cores, vector<int>({0, 2, 3}));
    EXPECT_EQ(opt.user, "#1000");
    EXPECT_EQ(opt.spec.work_dir.string(), "/tmp");
    EXPECT_EQ(opt.spec.environment.at("A"), "1");
    EXPECT_EQ(opt.spec.environment.at("B"), "x=y");
    EXPECT_TRUE(opt.debug);
}

TEST(OptionsTest, InputFile) {
    auto opt = parse({"--input", "data.in", "--", "cat"});
    EXPECT_EQ(opt.spec.input.type, input_source::kind::file);
    EXPECT_EQ(opt.spec.input.path.string(), "data.in");
}

TEST(OptionsTest, InvalidValues) {
    namespace po = boost::program_options;
    EXPECT_THROW(parse({"--timelimit", "-1", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--timelimit", "abc", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--walltimelimit", "inf", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--cores", "3-1", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--cores", "a", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--env", "NOVALUE", "--", "true"}), po::error);
    EXPECT_THROW(parse({"--timelimit", "1"}), po::error);
}

TEST(OptionsTest, HelpDoesNotRequireCommand) {
    auto opt = parse({"--help"});
    EXPECT_TRUE(opt.help);
    EXPECT_NE(opt.usage.find("--timelimit"), string::npos);
}

TEST(OptionsTest, CoreList) {
    EXPECT_EQ(parse_core_list("1").ids, vector<int>({1}));
    EXPECT_EQ(parse_core_list("0-2,5").ids, vector<int>({0, 1, 2, 5}));
}
