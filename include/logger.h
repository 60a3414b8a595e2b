#pragma once
#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

/**
 * Diagnostic sink for cache tables and the server process.
 *
 * Every line is written as "[%F %T] <prefix><message>" to the wrapped stream.
 * Writes are serialized so concurrent tables can share one logger.
 */
class Logger {
public:
    /**
     * @param out    Destination stream, must outlive the logger
     * @param prefix Text placed between the timestamp and the message
     */
    explicit Logger(std::ostream& out = std::cerr, std::string prefix = "");

    /**
     * Write one timestamped line.
     */
    void log(const std::string& message);

    /**
     * Join all arguments with single spaces and write them as one line.
     */
    template <typename... Args>
    void print(const Args&... args) {
        std::ostringstream ss;
        bool first = true;
        ((ss << (first ? "" : " "), write_arg(ss, args), first = false), ...);
        log(ss.str());
    }

    const std::string& prefix() const;

private:
    template <typename T, typename = void>
    struct is_streamable : std::false_type {};

    template <typename T>
    struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
        : std::true_type {};

    // Types without operator<< (e.g. custom keys) print as a placeholder
    template <typename T>
    static void write_arg(std::ostream& ss, const T& arg) {
        if constexpr (is_streamable<T>::value) {
            ss << arg;
        } else {
            ss << "<unprintable>";
        }
    }

    std::ostream& out_;
    std::string prefix_;
    std::mutex mutex_;   ///< Serializes writes to out_
};

/// Logger writing to std::cerr with the given prefix.
std::shared_ptr<Logger> make_stderr_logger(const std::string& prefix = "");

#endif // LOGGER_H
