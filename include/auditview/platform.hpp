// ==============================================================================
// auditview/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Единый тип путей std::filesystem::path и явные преобразования в UTF-8
// - Определение TTY для stdout/stderr
// - Идентификация ОС
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef AUDITVIEW_PLATFORM_HPP
#define AUDITVIEW_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace auditview::platform {

/// Построить path из UTF-8 строки (argv, конфигурация)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать path в UTF-8 строку для вывода и сообщений об ошибках
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

/// Имя ОС: "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

}  // namespace auditview::platform

#endif  // AUDITVIEW_PLATFORM_HPP
