#pragma once

#include <ostream>

namespace vecanalogy {

// 命令行入口：结果写到 out，警告和错误写到 err，返回进程退出码
int RunCommandLine(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace vecanalogy
