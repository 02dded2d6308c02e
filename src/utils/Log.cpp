#include "utils/Log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace pd::log
{

namespace
{

std::mutex s_mutex;
std::ofstream s_ofs;
std::optional<std::filesystem::path> s_path;

} // namespace

void set_log_file(std::filesystem::path const &path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    if (path.empty())
    {
        s_path.reset();
        return;
    }
    s_path = path;
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        return;
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace pd::log
