// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "logger.hpp"
#include "../base/config_file.hpp"
#include "../utils.hpp"
#include <rocket/ascii_numput.hpp>
#include <time.h>
#include <fcntl.h>
#include <pthread.h>
#include <sys/syscall.h>
namespace triton {
namespace {

struct Level_Config
  {
    char tag[16] = "";
    bool expendable = false;
    cow_string color;
    cow_vector<cow_string> files;
  };

struct Message
  {
    uint8_t level;
    uint32_t thrd_lwpid;
    char thrd_name[16];
    const char* func;
    const char* file;
    uint32_t line;
    cow_string text;
  };

void
do_color(linear_buffer& mtext, const Level_Config& lconf, const char* code)
  {
    if(lconf.color.empty())
      return;

    // Emit the sequence only if colors are enabled.
    mtext.putc('\x1B');
    mtext.putc('[');
    mtext.puts(code);
    mtext.putc('m');
  }

void
do_put_escaped(linear_buffer& mtext, const Level_Config& lconf, const cow_string& text)
  {
    for(char ch : text) {
      uint32_t uch = static_cast<unsigned char>(ch);
      if(uch == '\t')
        mtext.putc('\t');
      else if(uch == '\n')
        mtext.puts("\n\t");
      else if((uch >= 0x20) && (uch != 0x7F))
        mtext.putc(ch);
      else {
        // Make non-printable characters visible.
        static constexpr char xdigits[] = "0123456789ABCDEF";
        char seq[5] = "\\x";
        seq[2] = xdigits[uch >> 4];
        seq[3] = xdigits[uch & 15];
        do_color(mtext, lconf, "7");
        mtext.putn(seq, 4);
        do_color(mtext, lconf, "27");
      }
    }
  }

void
do_write_nothrow(::std::map<cow_string, unique_posix_fd>& io_files, const Level_Config& lconf,
                 const Message& msg) noexcept
  try {
    linear_buffer mtext;
    ::rocket::ascii_numput nump;

    // Get the local system time.
    struct timespec tv;
    ::clock_gettime(CLOCK_REALTIME, &tv);
    struct tm tm;
    ::localtime_r(&(tv.tv_sec), &tm);

    // Write the timestamp and tag.
    do_color(mtext, lconf, lconf.color.c_str());
    char tstr[64];
    size_t tlen = ::strftime(tstr, sizeof(tstr), "%Y-%m-%d %H:%M:%S", &tm);
    mtext.putn(tstr, tlen);
    mtext.putc('.');
    nump.put_DU(static_cast<uint32_t>(tv.tv_nsec), 9);
    mtext.putn(nump.data(), 9);
    mtext.putc(' ');
    do_color(mtext, lconf, "22;7");  // no bright; inverse
    mtext.puts(lconf.tag);
    do_color(mtext, lconf, "0");  // reset
    mtext.putc(' ');

    // Write the message.
    do_color(mtext, lconf, lconf.color.c_str());
    do_put_escaped(mtext, lconf, msg.text);
    do_color(mtext, lconf, "0");
    mtext.puts("\n\t");

    // Write the thread name and ID, then the source location.
    do_color(mtext, lconf, "90");  // grey
    mtext.puts("@@ thread ");
    nump.put_DU(msg.thrd_lwpid);
    mtext.putn(nump.data(), nump.size());
    mtext.puts(" [");
    mtext.putn(msg.thrd_name, ::strnlen(msg.thrd_name, sizeof(msg.thrd_name)));
    mtext.puts("] ");

    do_color(mtext, lconf, "34");  // blue
    mtext.puts("inside function `");
    mtext.puts(msg.func);
    mtext.puts("` at '");
    mtext.puts(msg.file);
    mtext.putc(':');
    nump.put_DU(msg.line);
    mtext.putn(nump.data(), nump.size());
    mtext.putc('\'');
    do_color(mtext, lconf, "0");  // reset
    mtext.putc('\n');

    // Write the message to all output files. Errors are ignored.
    for(const auto& file : lconf.files) {
      auto r = io_files.emplace(file, unique_posix_fd());
      if(r.second) {
        // A new element has just been inserted, so open the file.
        if(file == "/dev/stdout")
          r.first->second.reset(::dup(STDOUT_FILENO));
        else if(file == "/dev/stderr")
          r.first->second.reset(::dup(STDERR_FILENO));
        else
          r.first->second.reset(::open(file.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
      }

      if(r.first->second)
        (void)! ::write(r.first->second.get(), mtext.data(), mtext.size());
    }
  }
  catch(exception& stdex) {
    ::fprintf(stderr,
        "WARNING: Failed to write log message: %s\n"
        "[exception class `%s`]\n",
        stdex.what(), typeid(stdex).name());
  }

}  // namespace

TRITON_HIDDEN_X_STRUCT(Logger,
  Level_Config);

TRITON_HIDDEN_X_STRUCT(Logger,
  Message);

Logger::
Logger() noexcept
  {
  }

Logger::
~Logger()
  {
  }

void
Logger::
reload(const Config_File& conf_file, bool verbose)
  {
    // Parse new configuration.
    cow_vector<X_Level_Config> levels;
    static constexpr char names[][8] = { "fatal", "error", "warn", "info", "debug", "trace" };
    levels.reserve(size(names));

    for(const char* name : names) {
      auto& lconf = levels.emplace_back();
      ::snprintf(lconf.tag, sizeof(lconf.tag), "[%s]", name);
      lconf.color = conf_file.get_string_opt(sformat("logger.$1.color", name)).value_or(empty_cow_string);
      lconf.expendable = conf_file.get_boolean_opt(sformat("logger.$1.expendable", name)).value_or(false);

      bool has_stdout = false;
      size_t nfiles = conf_file.get_array_size_opt(sformat("logger.$1.files", name)).value_or(0);
      for(size_t k = 0;  k != nfiles;  ++k) {
        const auto& file = conf_file.get_string(sformat("logger.$1.files[$2]", name, k));
        if(file.empty())
          continue;

        lconf.files.emplace_back(file);
        has_stdout |= (file == "/dev/stdout") || (file == "/dev/stderr");
      }

      // In verbose mode, write all levels to standard output, so they are
      // always visible.
      if(verbose && !has_stdout)
        lconf.files.emplace_back(sref("/dev/stdout"));
    }

    uint32_t level_bits = 0;
    for(size_t k = 0;  k != levels.size();  ++k)
      if(levels[k].files.size() != 0)
        level_bits |= 1U << k;

    if(level_bits == 0)
      ::fputs("WARNING: Logger is disabled.\n", stderr);

    // Set up new data.
    plain_mutex::unique_lock lock(this->m_conf_mutex);
    this->m_conf_levels.swap(levels);
    this->m_conf_level_bits.store(level_bits);
  }

void
Logger::
thread_loop()
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    while(this->m_queue.empty())
      this->m_queue_avail.wait(lock);

    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    this->m_io_queue.clear();
    this->m_io_queue.swap(this->m_queue);
    lock.unlock();

    lock.lock(this->m_conf_mutex);
    const auto levels = this->m_conf_levels;
    lock.unlock();

    // Write all elements. Expendable levels are dropped under backlog.
    bool backlogged = this->m_io_queue.size() > 1000;
    for(const auto& msg : this->m_io_queue)
      if(msg.level >= levels.size())
        continue;
      else if(backlogged && levels[msg.level].expendable)
        continue;
      else
        do_write_nothrow(this->m_io_files, levels[msg.level], msg);

    this->m_io_queue.clear();
    this->m_io_files.clear();
  }

void
Logger::
enqueue(uint8_t level, const char* func, const char* file, uint32_t line, const cow_string& text)
  {
    // Fill in the name and LWP ID of the calling thread.
    X_Message msg;
    msg.level = level;
    msg.thrd_lwpid = static_cast<uint32_t>(::syscall(SYS_gettid));

    if(::pthread_getname_np(::pthread_self(), msg.thrd_name, sizeof(msg.thrd_name)) != 0)
      ::strcpy(msg.thrd_name, "unknown");

    msg.func = func;
    msg.file = file;
    msg.line = line;
    msg.text = text;

    // Enqueue the element.
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    this->m_queue.emplace_back(move(msg));
    this->m_queue_avail.notify_one();
  }

void
Logger::
synchronize() noexcept
  {
    // Get all pending elements.
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    if(this->m_queue.empty())
      return;

    this->m_io_queue.clear();
    this->m_io_queue.swap(this->m_queue);
    lock.unlock();

    lock.lock(this->m_conf_mutex);
    const auto levels = this->m_conf_levels;
    lock.unlock();

    // Write all elements.
    for(const auto& msg : this->m_io_queue)
      if(msg.level < levels.size())
        do_write_nothrow(this->m_io_files, levels[msg.level], msg);

    this->m_io_queue.clear();
    this->m_io_files.clear();
  }

}  // namespace triton
