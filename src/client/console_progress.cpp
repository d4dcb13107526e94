#include "progress.hpp"
#include "logging.hpp"
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace btflash {

ConsoleProgress::ConsoleProgress(FILE *out) : out_(out) {
  Logger::instance().set_prelude([this] { break_line(); });
}

ConsoleProgress::~ConsoleProgress() {
  Logger::instance().set_prelude(nullptr);
  break_line();
}

int ConsoleProgress::columns() const {
  struct winsize ws {};
  if (::ioctl(fileno(out_), TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  return 80;
}

void ConsoleProgress::break_line() {
  if (!inline_)
    return;
  std::fputc('\n', out_);
  std::fflush(out_);
  inline_ = false;
}

void ConsoleProgress::on_progress(size_t completed, size_t total,
                                  duration elapsed) {
  if (total == 0)
    return;
  long secs = (long)std::chrono::duration_cast<std::chrono::seconds>(elapsed)
                  .count();
  char tail[48];
  std::snprintf(tail, sizeof(tail), "] %3zu%% %3ld s", completed * 100 / total,
                secs);
  const std::string head = "[INFO] Progress: [";
  int width = columns() - (int)head.size() - (int)std::string(tail).size() - 1;
  if (width < 0)
    width = 0;
  size_t filled = (size_t)width * completed / total;
  std::string bar(filled, '*');
  bar.resize((size_t)width, ' ');
  std::fprintf(out_, "\r%s%s%s", head.c_str(), bar.c_str(), tail);
  inline_ = completed < total;
  if (!inline_)
    std::fputc('\n', out_);
  std::fflush(out_);
}

} // namespace btflash
