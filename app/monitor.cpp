// app/monitor.cpp
// amicall-monitor: ncurses console over TelephonyProvider.
// Features:
// - Live table of calls started from this console with their lifecycle state
// - Dial a number, hang up the selected call, purge finished calls, reconnect
// - Log view fed by the library logger
//
// Run:
//   ./amicall-monitor 127.0.0.1 5038 callmon 'secret'
// or set AMI_HOST/AMI_PORT/AMI_USER/AMI_SECRET (and AMI_CHANNEL_TECH, AMI_CONTEXT,
// AMI_EXTEN, AMI_CALLER_ID, AMI_ACTION_TIMEOUT_MS) in the environment.
// AMICALL_LOG_FILE additionally writes the log to a rotating file.

#include "amicall/log.hpp"
#include "amicall/provider.hpp"

#include <ncursesw/ncurses.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static std::atomic_bool g_running{true};

static inline std::string now_ts() {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

static int secs_between(amicall::WallClock::time_point t0, amicall::WallClock::time_point t1) {
  if (t1 < t0) return 0;
  return (int)std::chrono::duration_cast<std::chrono::seconds>(t1 - t0).count();
}

struct UiState {
  int selected = 0;
  std::string flash;  // one-line result of the last key action
};

// Replaces the library's stderr logger (stderr is the curses screen).
static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> install_logger() {
  auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(2000);
  ring->set_pattern("%Y-%m-%d %H:%M:%S  %l  %v");
  std::vector<spdlog::sink_ptr> sinks{ring};

  if (const char* path = std::getenv("AMICALL_LOG_FILE")) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
    } catch (const spdlog::spdlog_ex& ex) {
      std::cerr << "log file disabled: " << ex.what() << "\n";
    }
  }

  spdlog::drop(amicall::kLoggerName);
  auto lg = std::make_shared<spdlog::logger>(amicall::kLoggerName, sinks.begin(), sinks.end());
  lg->set_level(spdlog::level::debug);
  spdlog::register_logger(lg);
  return ring;
}

static std::string call_row(const amicall::CallRecord& c, int idx) {
  auto now = amicall::WallClock::now();
  auto until = c.end_time ? *c.end_time : now;
  int talk = c.answer_time ? secs_between(*c.answer_time, until) : 0;

  std::ostringstream line;
  line << std::setw(3) << idx + 1 << "  "
       << std::left << std::setw(11) << amicall::to_string(c.status) << std::right
       << std::setw(6) << (std::to_string(secs_between(c.start_time, until)) + "s") << "  "
       << "talk=" << std::setw(5) << (std::to_string(talk) + "s") << "  "
       << std::left << std::setw(16) << c.phone_number << std::right << "  "
       << c.channel;
  if (!c.unique_id.empty()) line << "  uid=" << c.unique_id;
  if (c.hangup_cause) line << "  cause=" << *c.hangup_cause;
  return line.str();
}

static void tui_draw(amicall::TelephonyProvider& provider, UiState& ui) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);
  auto& client = provider.client();

  mvprintw(0, 0, "amicall monitor  %s:%d  [%s]  Time: %s", provider.config().ami_host.c_str(),
           provider.config().ami_port, amicall::to_string(client.state()), now_ts().c_str());
  mvprintw(1, 0, "Keys: [Up/Down]=Select Call  [D]=Dial  [H]=Hangup  [P]=Purge Finished  [R]=Reconnect  [L]=Logs  [Q]=Quit");

  auto calls = client.list_calls();

  int list_start = 3;
  mvprintw(list_start - 1, 0, "Calls: %d (active %d)", (int)calls.size(),
           (int)client.list_active_calls().size());
  mvhline(list_start, 0, ACS_HLINE, maxx);

  if (!calls.empty()) {
    ui.selected = std::max(0, std::min(ui.selected, (int)calls.size() - 1));
  }

  int y = list_start + 1;
  for (int idx = 0; idx < (int)calls.size() && y < maxy - 6; idx++, y++) {
    bool sel = (idx == ui.selected);
    if (sel) attron(A_REVERSE);
    std::string s = call_row(calls[idx], idx);
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y, 0, "%s", s.c_str());
    if (sel) attroff(A_REVERSE);
  }

  int detail_y = maxy - 5;
  mvhline(detail_y - 1, 0, ACS_HLINE, maxx);
  mvprintw(detail_y, 0, "Selected Call:");
  if (!calls.empty()) {
    const auto& c = calls[ui.selected];
    mvprintw(detail_y + 1, 0, "CallID: %s   Channel: %s   Uniqueid: %s", c.call_id.c_str(),
             c.channel.c_str(), c.unique_id.empty() ? "?" : c.unique_id.c_str());
    mvprintw(detail_y + 2, 0, "Status: %s   Answered: %s   Bridged: %s",
             amicall::to_string(c.status), c.answer_time ? "yes" : "no",
             c.bridge_time ? "yes" : "no");
  } else {
    mvprintw(detail_y + 1, 0, "No calls yet. Press D to dial a number.");
  }
  if (!ui.flash.empty()) {
    std::string f = ui.flash;
    if ((int)f.size() > maxx - 1) f.resize(maxx - 1);
    mvprintw(maxy - 1, 0, "%s", f.c_str());
  }

  refresh();
}

static void tui_show_logs(spdlog::sinks::ringbuffer_sink_mt& ring) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  mvprintw(0, 0, "Event Log (press any key to return)");
  mvhline(1, 0, ACS_HLINE, maxx);

  auto lines = ring.last_formatted(maxy - 2);
  int y = 2;
  for (const auto& l : lines) {
    if (y >= maxy) break;
    std::string s = l;
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y++, 0, "%s", s.c_str());
  }
  refresh();
  getch();
}

static std::string prompt(const char* label) {
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);
  (void)maxx;
  nodelay(stdscr, FALSE);
  echo();
  curs_set(1);
  move(maxy - 1, 0);
  clrtoeol();
  mvprintw(maxy - 1, 0, "%s", label);
  char buf[64] = {0};
  getnstr(buf, sizeof(buf) - 1);
  noecho();
  curs_set(0);
  nodelay(stdscr, TRUE);
  return std::string(buf);
}

static void signal_handler(int) {
  g_running.store(false);
}

int main(int argc, char** argv) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  amicall::ProviderConfig cfg;
  try {
    cfg = amicall::ProviderConfig::from_args_and_env(argc, argv);
  } catch (const amicall::AmiError& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }
  if (argc < 5 && (std::getenv("AMI_USER") == nullptr || std::getenv("AMI_SECRET") == nullptr)) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> <user> <secret>\n"
              << "Or set AMI_HOST/AMI_PORT/AMI_USER/AMI_SECRET in environment.\n";
    return 1;
  }

  auto ring = install_logger();
  amicall::logger()->info("Starting...");

  amicall::TelephonyProvider provider(cfg);
  if (!provider.initialize()) {
    auto err = provider.client().last_error();
    std::cerr << "Connection/login error: " << (err ? err->what() : "unknown") << "\n";
    return 1;
  }

  UiState ui;
  provider.register_call_callback(amicall::lifecycle::kCallEnded, [](const amicall::Message& m) {
    amicall::logger()->info("call ended on {} (cause {})", m.get("Channel"), m.get("Cause"));
  });

  // Init TUI
  initscr();
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);  // non-blocking
  curs_set(0);

  while (g_running.load()) {
    tui_draw(provider, ui);

    int ch = getch();
    if (ch == ERR) {
      std::this_thread::sleep_for(std::chrono::milliseconds(120));
      continue;
    }

    if (ch == 'q' || ch == 'Q') {
      g_running.store(false);
      break;
    }

    if (ch == 'l' || ch == 'L') {
      nodelay(stdscr, FALSE);
      tui_show_logs(*ring);
      nodelay(stdscr, TRUE);
      continue;
    }

    if (ch == KEY_UP) { ui.selected = std::max(0, ui.selected - 1); continue; }
    if (ch == KEY_DOWN) { ui.selected++; continue; }

    if (ch == 'd' || ch == 'D') {
      std::string number = prompt("Dial number: ");
      if (number.empty()) continue;
      auto r = provider.make_call(number);
      ui.flash = r ? "Originated " + r.call_id : "Dial failed: " + r.message;
      continue;
    }

    if (ch == 'h' || ch == 'H') {
      auto calls = provider.client().list_calls();
      if (calls.empty()) continue;
      int idx = std::max(0, std::min(ui.selected, (int)calls.size() - 1));
      auto r = provider.end_call(calls[idx].call_id);
      ui.flash = r ? "Hangup requested for " + r.call_id : "Hangup failed: " + r.message;
      continue;
    }

    if (ch == 'r' || ch == 'R') {
      if (provider.is_available()) continue;
      bool ok = provider.initialize();
      auto err = provider.client().last_error();
      ui.flash = ok ? "Reconnected" : "Reconnect failed: " + std::string(err ? err->what() : "unknown");
      continue;
    }

    if (ch == 'p' || ch == 'P') {
      size_t n = provider.client().purge_finished_calls();
      ui.flash = "Purged " + std::to_string(n) + " finished call(s)";
      continue;
    }
  }

  endwin();
  provider.cleanup();
  return 0;
}
