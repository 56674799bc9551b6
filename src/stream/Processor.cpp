// SPDX-License-Identifier: Apache-2.0
#include "Processor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <stream/ParserRegistry.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <unistd.h>
#endif

namespace agentstream
{

namespace
{
    constexpr auto ReadChunkSize = std::size_t { 4096 };
    constexpr auto DiagnosticWidth = std::size_t { 100 };

    auto lastSystemError() -> std::string
    {
#ifdef _WIN32
        return std::system_category().message(static_cast<int>(GetLastError()));
#else
        return std::strerror(errno);
#endif
    }
} // namespace

struct Processor::Impl
{
    std::unique_ptr<Parser> parser;
    Formatter& formatter;
    std::ostream* rawLog = nullptr;

#ifdef _WIN32
    HANDLE readEnd = INVALID_HANDLE_VALUE;
    HANDLE writeEnd = INVALID_HANDLE_VALUE;
#else
    int readEnd = -1;
    int writeEnd = -1;
#endif

    std::jthread decoder;

    std::mutex writeMutex; ///< Guards writeEnd and closed.
    bool closed = false;

    std::mutex closeMutex; ///< Serializes close() callers.
    std::optional<VoidResult> closeResult;

    std::optional<Error> readerError; ///< Set by the decoder before it exits.
    std::atomic<bool> readerFailed = false;

    std::atomic<std::int64_t> eventCount = 0;
    std::atomic<std::int64_t> errorCount = 0;
    std::atomic<std::chrono::system_clock::rep> lastActivity = 0;

    Impl(std::unique_ptr<Parser> p, Formatter& f, std::ostream* log): parser(std::move(p)), formatter(f), rawLog(log)
    {
    }

    ~Impl()
    {
        closeWriteEnd();
        if (decoder.joinable())
            decoder.join();
        closeReadEnd();
    }

    auto openPipe() -> VoidResult
    {
#ifdef _WIN32
        SECURITY_ATTRIBUTES sa {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = FALSE;
        if (!CreatePipe(&readEnd, &writeEnd, &sa, 0))
            return makeError(ErrorCode::IoError, std::format("Failed to create pipe: {}", lastSystemError()));
#else
        int fds[2];
        if (::pipe(fds) != 0)
            return makeError(ErrorCode::IoError, std::format("Failed to create pipe: {}", lastSystemError()));
        readEnd = fds[0];
        writeEnd = fds[1];
#endif
        return {};
    }

    void closeWriteEnd()
    {
#ifdef _WIN32
        if (writeEnd != INVALID_HANDLE_VALUE)
        {
            CloseHandle(writeEnd);
            writeEnd = INVALID_HANDLE_VALUE;
        }
#else
        if (writeEnd >= 0)
        {
            ::close(writeEnd);
            writeEnd = -1;
        }
#endif
    }

    void closeReadEnd()
    {
#ifdef _WIN32
        if (readEnd != INVALID_HANDLE_VALUE)
        {
            CloseHandle(readEnd);
            readEnd = INVALID_HANDLE_VALUE;
        }
#else
        if (readEnd >= 0)
        {
            ::close(readEnd);
            readEnd = -1;
        }
#endif
    }

    /// Reads the next chunk; 0 means end of input.
    auto readChunk(char* buffer, std::size_t size) -> Result<std::size_t>
    {
#ifdef _WIN32
        DWORD bytesRead = 0;
        if (!ReadFile(readEnd, buffer, static_cast<DWORD>(size), &bytesRead, nullptr))
        {
            if (GetLastError() == ERROR_BROKEN_PIPE)
                return 0;
            return makeError(ErrorCode::IoError, std::format("Pipe read failed: {}", lastSystemError()));
        }
        return static_cast<std::size_t>(bytesRead);
#else
        while (true)
        {
            auto const n = ::read(readEnd, buffer, size);
            if (n >= 0)
                return static_cast<std::size_t>(n);
            if (errno != EINTR)
                return makeError(ErrorCode::IoError, std::format("Pipe read failed: {}", lastSystemError()));
        }
#endif
    }

    auto writeAll(std::string_view data) -> VoidResult
    {
        while (!data.empty())
        {
#ifdef _WIN32
            DWORD written = 0;
            if (!WriteFile(writeEnd, data.data(), static_cast<DWORD>(data.size()), &written, nullptr))
                return makeError(ErrorCode::IoError, std::format("Pipe write failed: {}", lastSystemError()));
            data.remove_prefix(written);
#else
            auto const n = ::write(writeEnd, data.data(), data.size());
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::IoError, std::format("Pipe write failed: {}", lastSystemError()));
            }
            data.remove_prefix(static_cast<std::size_t>(n));
#endif
        }
        return {};
    }

    void decodeLoop()
    {
        auto pending = std::string {};
        auto chunk = std::array<char, ReadChunkSize> {};

        while (true)
        {
            auto const n = readChunk(chunk.data(), chunk.size());
            if (!n)
            {
                errorCount.fetch_add(1);
                log::debug("reader error: {}", n.error().message);
                readerError = n.error();
                readerFailed.store(true);
                pending.clear();
                drain(chunk);
                return;
            }
            if (*n == 0)
                break;

            // Bytes before the new chunk hold no newline.
            auto const scanned = pending.size();
            pending.append(chunk.data(), *n);

            auto start = std::size_t { 0 };
            for (auto newline = pending.find('\n', scanned); newline != std::string::npos;
                 newline = pending.find('\n', start))
            {
                processLine(std::string_view(pending).substr(start, newline - start));
                start = newline + 1;
            }
            pending.erase(0, start);
        }

        // A final line without terminating newline.
        if (!pending.empty())
            processLine(pending);
    }

    /// Discards input until end of stream so writers blocked on a full pipe are released.
    /// The read end stays open, so writers never see a broken pipe.
    void drain(std::array<char, ReadChunkSize>& chunk)
    {
        while (true)
        {
            auto const n = readChunk(chunk.data(), chunk.size());
            if (!n)
            {
                log::debug("reader error while draining: {}", n.error().message);
                return;
            }
            if (*n == 0)
                return;
        }
    }

    void processLine(std::string_view line)
    {
        auto const trimmed = text::trim(line);
        if (trimmed.empty())
            return;

        if (rawLog)
            writeRawLog(trimmed);

        lastActivity.store(std::chrono::system_clock::now().time_since_epoch().count());

        if (!json::isValid(trimmed))
        {
            errorCount.fetch_add(1);
            log::debug("invalid JSON: {}", text::truncate(trimmed, DiagnosticWidth));
            return;
        }

        auto events = parser->parse(trimmed);
        if (!events)
        {
            errorCount.fetch_add(1);
            log::debug("parse error: {} (raw: {})", events.error(), text::truncate(trimmed, DiagnosticWidth));
            return;
        }

        for (auto const& event: *events)
        {
            eventCount.fetch_add(1);
            log::trace("{} event", eventTypeName(event.type));
            formatter.formatEvent(event);
        }
    }

    void writeRawLog(std::string_view line)
    {
        rawLog->write(line.data(), static_cast<std::streamsize>(line.size()));
        rawLog->put('\n');
        rawLog->flush();
        if (!*rawLog)
        {
            errorCount.fetch_add(1);
            log::debug("raw log write error");
            rawLog->clear();
        }
    }
};

Processor::Processor(Token, std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

Processor::~Processor()
{
    static_cast<void>(close());
}

auto Processor::create(std::string_view agentCommand, Formatter& formatter, ProcessorOptions options)
    -> Result<std::unique_ptr<Processor>>
{
    if (outputFlags(agentCommand).empty())
        return nullptr;

    auto parser = parserFor(agentCommand);
    if (!parser)
        return nullptr;

    return create(std::move(parser), formatter, options);
}

auto Processor::create(std::unique_ptr<Parser> parser, Formatter& formatter, ProcessorOptions options)
    -> Result<std::unique_ptr<Processor>>
{
    if (!parser)
        return makeError(ErrorCode::InvalidArgument, "Processor requires a parser");

    auto impl = std::make_unique<Impl>(std::move(parser), formatter, options.rawLog);
    if (auto result = impl->openPipe(); !result)
        return std::unexpected(result.error());

    try
    {
        impl->decoder = std::jthread([raw = impl.get()] { raw->decodeLoop(); });
    }
    catch (std::system_error const& e)
    {
        return makeError(ErrorCode::IoError, std::format("Failed to start decoder thread: {}", e.what()));
    }

    log::debug("stream processor started for {}", impl->parser->name());
    return std::make_unique<Processor>(Token {}, std::move(impl));
}

auto Processor::write(std::string_view data) -> VoidResult
{
    auto const lock = std::scoped_lock(_impl->writeMutex);
    if (_impl->closed)
        return makeError(ErrorCode::IoError, "Processor is closed");
    if (_impl->readerFailed.load())
        return makeError(ErrorCode::IoError, "Stream decoder stopped after a read error");
    return _impl->writeAll(data);
}

auto Processor::close() -> VoidResult
{
    auto const lock = std::scoped_lock(_impl->closeMutex);
    if (_impl->closeResult)
        return *_impl->closeResult;

    {
        auto const writeLock = std::scoped_lock(_impl->writeMutex);
        _impl->closed = true;
        _impl->closeWriteEnd();
    }

    if (_impl->decoder.joinable())
        _impl->decoder.join();

    auto const stats = this->stats();
    log::debug("stream processor closed: {} events, {} errors", stats.events, stats.errors);

    if (_impl->readerError)
        _impl->closeResult = std::unexpected(*_impl->readerError);
    else
        _impl->closeResult = VoidResult {};
    return *_impl->closeResult;
}

auto Processor::stats() const noexcept -> ProcessorStats
{
    return ProcessorStats {
        .events = _impl->eventCount.load(),
        .errors = _impl->errorCount.load(),
    };
}

auto Processor::lastActivity() const noexcept -> std::chrono::system_clock::time_point
{
    auto const ticks = _impl->lastActivity.load();
    if (ticks == 0)
        return {};
    return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(ticks));
}

auto Processor::parserName() const -> std::string_view
{
    return _impl->parser->name();
}

} // namespace agentstream
