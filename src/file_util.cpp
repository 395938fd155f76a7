#include "file_util.h"

#include "log.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bluos
{

static bool write_all(int fd, const std::string &data)
{
  size_t written = 0;
  while (written < data.size())
  {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n < 0)
    {
      if (errno == EINTR)
        continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

bool write_private_file(const std::string &path, const std::string &content, std::string &error)
{
  std::filesystem::path target(path);
  if (target.has_parent_path())
  {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
    {
      error = "cannot create " + target.parent_path().string() + ": " + ec.message();
      return false;
    }
    if (chmod(target.parent_path().c_str(), 0700) != 0)
      LOG("Could not restrict permissions of " << target.parent_path().string() << ": " << std::strerror(errno));
  }

  std::string tmp = path + ".tmp." + std::to_string(getpid());
  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0)
  {
    error = "cannot open " + tmp + ": " + std::strerror(errno);
    return false;
  }

  if (!write_all(fd, content) || fsync(fd) != 0)
  {
    error = "cannot write " + tmp + ": " + std::strerror(errno);
    close(fd);
    unlink(tmp.c_str());
    return false;
  }
  if (close(fd) != 0)
  {
    error = "cannot close " + tmp + ": " + std::strerror(errno);
    unlink(tmp.c_str());
    return false;
  }

  if (rename(tmp.c_str(), path.c_str()) != 0)
  {
    error = "cannot rename " + tmp + ": " + std::strerror(errno);
    unlink(tmp.c_str());
    return false;
  }
  return true;
}

} // namespace bluos
