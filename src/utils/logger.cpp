#include "utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#include "utils/compiler.hpp"

namespace {
// Префикс, с которого начинается каждая строка лога
constexpr const char *LOG_PREFIX = "CHRONOID: ";

/**
 * @brief Получение текущего времени в формате для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string getCurrentTimeFormatted()
{
    // Получаем текущее время из системных часов
    auto now = std::chrono::system_clock::now();
    // now -> time_t для использования localtime_r
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    // Получаем миллисекунды текущей секунды
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime {};
#if defined(CHRONOID_PLATFORM_WINDOWS)
    localtime_s(&localTime, &timeNow);
#else
    localtime_r(&timeNow, &localTime);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * @brief Извлекает имя файла из полного пути
 * @param fullPath Полный путь к файлу
 * @return Только имя файла без пути
 */
std::string_view extractFileName(const std::string_view fullPath)
{
    auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return fullPath.substr(pos + 1);
    }
    return fullPath;
}
} // namespace

/**
 * ANSI коды цветов для консольного вывода
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *CYAN = "\033[36m";
} // namespace ConsoleColor

namespace chronoid::utils {
Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , minimumLevel_(LogLevel::INFO)
    , colorOutput_(false)
    , output_(&std::cerr)
{
}

void Logger::enable(const LoggerOptions &options)
{
    bool needColorWarning = false;

    {
        std::lock_guard<std::mutex> lock(logMutex_);

        output_ = options.output != nullptr ? options.output : &std::cerr;
        minimumLevel_ = options.minLevel;

        // Цвета имеют смысл только для терминала, в произвольный поток пишем обычный текст
        colorOutput_ = false;
        if (options.useColors) {
            const auto isColorSupported
                = options.output == nullptr && isColorSupportedByTerminal();
            needColorWarning = !isColorSupported;
            colorOutput_ = isColorSupported;
        }

        enabled_ = true;
    }

    if (needColorWarning) {
        log(LogLevel::WARNING, "Цветной вывод запрошен, но недоступен для текущего потока вывода",
            __FILE__, __LINE__);
    }

    std::ostringstream configMsg;
    configMsg << "Логирование включено (минимальный уровень: " << levelToString(options.minLevel)
              << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";
    log(LogLevel::INFO, configMsg.str(), __FILE__, __LINE__);
}

void Logger::disable()
{
    log(LogLevel::INFO, "Логирование отключено", __FILE__, __LINE__);

    std::lock_guard<std::mutex> lock(logMutex_);
    enabled_ = false;
    output_ = &std::cerr;
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    minimumLevel_ = level;

    if (enabled_) {
        log(LogLevel::INFO, "Минимальный уровень логирования установлен на " + levelToString(level),
            __FILE__, __LINE__);
    }
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

void Logger::setUseColors(bool useColors)
{
    bool needColorWarning = false;
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        const auto isColorSupported = output_ == &std::cerr && isColorSupportedByTerminal();
        needColorWarning = useColors && !isColorSupported;
        colorOutput_ = useColors && isColorSupported;
    }

    if (needColorWarning) {
        log(LogLevel::WARNING, "Цветной вывод запрошен, но недоступен для текущего потока вывода",
            __FILE__, __LINE__);
    }
}

bool Logger::getUseColors() const
{
    return colorOutput_;
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    // Проверяем, включено ли логирование и подходит ли уровень сообщения
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    auto formattedMessage = formatLogMessage(level, message, file, line);

    std::lock_guard<std::mutex> lock(logMutex_);
    writeToStream(formattedMessage, level);
}

void Logger::fatal(const std::string &message, const std::string_view file, int line)
{
    const auto formattedMessage = formatLogMessage(LogLevel::CRITICAL, message, file, line);

    {
        std::lock_guard<std::mutex> lock(logMutex_);
        if (enabled_ && output_ != &std::cerr) {
            writeToStream(formattedMessage, LogLevel::CRITICAL);
        }
        std::cerr << LOG_PREFIX << formattedMessage << std::endl;
    }

    std::abort();
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    default:
        UNREACHABLE("Unsupported LogLevel");
    }
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line)
{
    std::ostringstream oss;

    // Формат: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    oss << "[" << getCurrentTimeFormatted() << "] "
        << "[" << levelToString(level) << "] ";

    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;

    return oss.str();
}

void Logger::writeToStream(const std::string &formattedMessage, LogLevel level)
{
    if (!colorOutput_) {
        *output_ << LOG_PREFIX << formattedMessage << std::endl;
        return;
    }

    const char *colorCode = ConsoleColor::RESET;
    switch (level) {
    case LogLevel::TRACE:
        colorCode = ConsoleColor::CYAN;
        break;
    case LogLevel::DEBUG:
        colorCode = ConsoleColor::BLUE;
        break;
    case LogLevel::INFO:
        colorCode = ConsoleColor::GREEN;
        break;
    case LogLevel::WARNING:
        colorCode = ConsoleColor::YELLOW;
        break;
    case LogLevel::ERROR:
        colorCode = ConsoleColor::RED;
        break;
    case LogLevel::CRITICAL:
        colorCode = ConsoleColor::MAGENTA;
        break;
    }

    *output_ << colorCode << LOG_PREFIX << formattedMessage << ConsoleColor::RESET << std::endl;
}

bool Logger::isColorSupportedByTerminal()
{
#if defined(CHRONOID_PLATFORM_UNIX)
    // В Unix-подобных системах проверяем переменную окружения TERM
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    const std::string_view termName(term);
    return termName != "dumb" && termName != "unknown";
#else
    // TODO: проверять ENABLE_VIRTUAL_TERMINAL_PROCESSING через GetConsoleMode на Windows
    return false;
#endif
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    // Отправляем собранное сообщение в логгер при уничтожении объекта
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace chronoid::utils
