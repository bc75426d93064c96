#ifndef SRC_GAME_LOG_H_
#define SRC_GAME_LOG_H_

#include <websocketpp/concurrency/basic.hpp>
#include <websocketpp/logger/basic.hpp>
#include <websocketpp/logger/levels.hpp>

typedef websocketpp::log::alevel alevel;
typedef websocketpp::log::elevel elevel;

// Same logger types a websocketpp endpoint uses for get_alog()/get_elog().
typedef websocketpp::log::basic<websocketpp::concurrency::basic, alevel> alog_type;
typedef websocketpp::log::basic<websocketpp::concurrency::basic, elevel> elog_type;

// ANSI color codes
#define COLOR_RESET   "\033[0m"
#define COLOR_RED     "\033[31m"
#define COLOR_GREEN   "\033[32m"
#define COLOR_YELLOW  "\033[33m"
#define COLOR_MAGENTA "\033[35m"
#define COLOR_CYAN    "\033[36m"
#define COLOR_BOLD    "\033[1m"

#endif  // SRC_GAME_LOG_H_
