// SessionConfig.hpp
#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

namespace ConfluenceScalper {
namespace Config {

struct SessionConfig {
    int session_start_hour_utc = 7;                  // London open
    int session_end_hour_utc = 20;                   // New York close (exclusive)
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // SESSION_CONFIG_HPP
