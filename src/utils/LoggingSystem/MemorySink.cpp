#include "MemorySink.hpp"

namespace LoggingSystem {

MemorySink::MemorySink(size_t capacity)
    : capacity(capacity == 0 ? 1 : capacity)
{
}

void MemorySink::write(const LogMessage& message)
{
    if (!accepts(message)) {
        return;
    }

    std::lock_guard<std::mutex> locker(mutex);
    if (buffer.size() >= capacity) {
        buffer.pop_front();
    }
    buffer.push_back(message);
}

std::vector<LogMessage> MemorySink::messages() const
{
    std::lock_guard<std::mutex> locker(mutex);
    return std::vector<LogMessage>(buffer.begin(), buffer.end());
}

size_t MemorySink::count(const std::string& module, LogLevel level) const
{
    std::lock_guard<std::mutex> locker(mutex);
    size_t n = 0;
    for (const auto& msg : buffer) {
        if (msg.module == module && msg.level >= level) {
            ++n;
        }
    }
    return n;
}

bool MemorySink::contains(const std::string& text) const
{
    std::lock_guard<std::mutex> locker(mutex);
    for (const auto& msg : buffer) {
        if (msg.message.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void MemorySink::clear()
{
    std::lock_guard<std::mutex> locker(mutex);
    buffer.clear();
}

}   // namespace LoggingSystem
