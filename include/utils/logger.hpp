#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace chronoid::utils {
/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка для отладки
    DEBUG, // Отладочные сообщения
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки, не прерывающие работу программы
    CRITICAL // Критические ошибки, прерывающие работу программы
};

/**
 * @struct LoggerOptions
 * @brief Параметры, с которыми включается логирование
 */
struct LoggerOptions {
    // Минимальный уровень сообщений для логирования
    LogLevel minLevel = LogLevel::INFO;
    // Использовать цветной вывод (если поддерживается терминалом)
    bool useColors = true;
    // Поток для вывода, nullptr означает std::cerr
    std::ostream *output = nullptr;
};

/**
 * @class Logger
 * @brief Управляет логированием сообщений с различными уровнями важности
 *
 * Logger является синглтоном и обеспечивает потокобезопасное логирование.
 * По умолчанию логирование отключено и должно быть явно включено пользователем.
 * Исключение составляют фатальные ошибки: они выводятся в stderr всегда.
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param options Параметры логирования
     */
    void enable(const LoggerOptions &options = {});

    /**
     * @brief Отключает логирование
     */
    void disable();

    /**
     * @brief Проверяет, включено ли логирование
     * @return true, если логирование включено
     */
    bool isEnabled() const;

    /**
     * @brief Установка минимального уровня логирования
     * @param level Минимальный уровень сообщений
     */
    void setMinLogLevel(LogLevel level);

    /**
     * @brief Получение текущего минимального уровня логирования
     * @return Текущий минимальный уровень
     */
    LogLevel getMinLogLevel() const;

    /**
     * @brief Включение или отключение цветного вывода
     * @param useColors true для использования цветного вывода, false для обычного текста
     */
    void setUseColors(bool useColors);

    /**
     * @brief Проверка, используется ли цветной вывод
     * @return true, если цветной вывод включен
     */
    bool getUseColors() const;

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, const std::string_view file = {},
             int line = 0);

    /**
     * @brief Сообщает о фатальной ошибке и аварийно завершает процесс
     *
     * Сообщение всегда выводится в stderr, даже если логирование отключено.
     * Если логирование включено и направлено в другой поток, сообщение
     * дублируется и туда.
     *
     * @param message Текст сообщения
     * @param file Имя файла
     * @param line Номер строки
     */
    [[noreturn]] void fatal(const std::string &message, const std::string_view file = {},
                            int line = 0);

private:
    // Запрещаем создание экземпляров класса напрямую
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // Состояние логгера
    std::atomic<bool> enabled_; // Включено ли логирование
    std::atomic<LogLevel> minimumLevel_; // Минимальный уровень логирования
    std::atomic<bool> colorOutput_; // Использовать цветной вывод
    std::ostream *output_; // Поток для вывода сообщений
    std::mutex logMutex_; // Мьютекс для потокобезопасности

    /**
     * @brief Преобразует уровень логирования в строку
     * @param level Уровень логирования
     * @return Текстовое представление уровня
     */
    static std::string levelToString(LogLevel level);

    /**
     * @brief Форматирует сообщение для вывода в лог
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла
     * @param line Номер строки
     * @return Отформатированное сообщение
     */
    static std::string formatLogMessage(LogLevel level, const std::string &message,
                                        const std::string_view file, int line);

    /**
     * @brief Выводит сообщение в поток логгера (вызывается под logMutex_)
     * @param formattedMessage Отформатированное сообщение
     * @param level Уровень сообщения (для цветового выделения)
     */
    void writeToStream(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     * @return true, если консоль поддерживает ANSI цвета
     */
    static bool isColorSupportedByTerminal();
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 */
class LogStream {
public:
    /**
     * @brief Создает поток логирования для указанного уровня
     * @param level Уровень логирования
     * @param file Имя файла, из которого произведен вызов
     * @param line Номер строки
     */
    LogStream(LogLevel level, const std::string_view file, int line);

    /**
     * @brief Деструктор, который отправляет собранное сообщение в логгер
     */
    ~LogStream();

    /**
     * @brief Оператор перенаправления для потокового формирования сообщения
     * @param val Значение для добавления в сообщение
     * @return Ссылка на текущий поток
     */
    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_; // Уровень логирования
    std::ostringstream stream_; // Поток для формирования сообщения
    std::string_view file_; // Имя файла
    int line_; // Номер строки
};

} // namespace chronoid::utils

// Проверка, пройдет ли сообщение указанного уровня фильтр логгера
#define LOG_LEVEL_ENABLED(level)                                                                   \
    (chronoid::utils::Logger::getInstance().isEnabled()                                            \
     && chronoid::utils::Logger::getInstance().getMinLogLevel() <= (level))

// Макросы для удобного логирования с автоматическим указанием файла и строки.
// Если уровень отфильтрован, выражение справа от макроса не вычисляется.
#define LOG_TRACE                                                                                  \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::TRACE))                                       \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG                                                                                  \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::DEBUG))                                       \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO                                                                                   \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::INFO))                                        \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::INFO, __FILE__, __LINE__)
#define LOG_WARNING                                                                                \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::WARNING))                                     \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::WARNING, __FILE__, __LINE__)
#define LOG_ERROR                                                                                  \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::ERROR))                                       \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_CRITICAL                                                                               \
    if (LOG_LEVEL_ENABLED(chronoid::utils::LogLevel::CRITICAL))                                    \
    chronoid::utils::LogStream(chronoid::utils::LogLevel::CRITICAL, __FILE__, __LINE__)
