// ==============================================================================
// luarestore/file_source.hpp - MOD-0005: Источник файлов
// ==============================================================================
//
// MOD-0005 io::file_source
// ADR-0010: std::filesystem::path
//
// Назначение:
// - Абстракция файловой системы для резолвера и обхода зависимостей
// - DiskFileSource: чтение с диска с ограничением времени
// - MemoryFileSource: набор файлов в памяти (тесты, встраивание)
//
// Реализации должны допускать одновременные вызовы из нескольких потоков.
//
// ==============================================================================

#ifndef LUARESTORE_FILE_SOURCE_HPP
#define LUARESTORE_FILE_SOURCE_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace luarestore::io {

// ----------------------------------------------------------------------------
// ReadError
// ----------------------------------------------------------------------------

enum class ReadErrorKind {
    FileNotFound,      // Файл не найден
    PermissionDenied,  // Нет доступа
    Timeout,           // Чтение не уложилось в таймаут
    IoError,           // Ошибка ввода-вывода
};

const char* read_error_kind_to_string(ReadErrorKind kind);

struct ReadError {
    ReadErrorKind kind = ReadErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to read file '<path>' - <message>"
    std::string format() const;
};

struct ReadResult {
    bool ok = false;
    std::string content;
    ReadError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

class FileSource {
public:
    virtual ~FileSource() = default;

    /// Существует ли обычный файл по пути
    virtual bool is_regular_file(const std::filesystem::path& path) const = 0;

    /// Канонический абсолютный путь; пустой путь, если канонизация невозможна
    virtual std::filesystem::path canonical(const std::filesystem::path& path) const = 0;

    /// Прочитать файл целиком
    virtual ReadResult read(const std::filesystem::path& path) const = 0;

protected:
    FileSource() = default;
};

// ----------------------------------------------------------------------------
// DiskFileSource
// ----------------------------------------------------------------------------

class DiskFileSource final : public FileSource {
public:
    explicit DiskFileSource(std::chrono::milliseconds read_timeout);

    bool is_regular_file(const std::filesystem::path& path) const override;
    std::filesystem::path canonical(const std::filesystem::path& path) const override;

    /// Читает блоками по 64 KiB; срок проверяется только между блоками
    /// (после каждого fread), сам блокирующий fread не прерывается.
    /// Истёкший срок - ReadErrorKind::Timeout, содержимое не отдаётся.
    ReadResult read(const std::filesystem::path& path) const override;

    std::chrono::milliseconds read_timeout() const { return read_timeout_; }

private:
    std::chrono::milliseconds read_timeout_;
};

// ----------------------------------------------------------------------------
// MemoryFileSource
// ----------------------------------------------------------------------------

/// Файлы в памяти. Пути нормализуются лексически и делаются абсолютными
/// относительно "/" ; канонический путь совпадает с нормализованным.
class MemoryFileSource final : public FileSource {
public:
    MemoryFileSource() = default;

    /// Добавить (или заменить) файл
    void add_file(const std::filesystem::path& path, std::string content);

    /// Файл существует, но чтение завершается ошибкой указанного вида
    void add_unreadable(const std::filesystem::path& path,
                        ReadErrorKind kind = ReadErrorKind::PermissionDenied);

    bool is_regular_file(const std::filesystem::path& path) const override;
    std::filesystem::path canonical(const std::filesystem::path& path) const override;
    ReadResult read(const std::filesystem::path& path) const override;

    /// Количество вызовов read() (проверка "каждый файл читается один раз")
    std::size_t read_count() const;

private:
    static std::filesystem::path normalize(const std::filesystem::path& path);

    std::map<std::filesystem::path, std::string> files_;
    std::map<std::filesystem::path, ReadErrorKind> unreadable_;
    mutable std::atomic<std::size_t> reads_{0};
};

}  // namespace luarestore::io

#endif  // LUARESTORE_FILE_SOURCE_HPP
