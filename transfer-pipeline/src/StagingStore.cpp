/**
 * @file StagingStore.cpp
 * @brief Local scratch files holding a job's payload between stages
 */

// Header Being Defined
#include <ferry/pipeline/StagingStore.hpp>

// System Includes
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Standard Library Includes
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>

namespace ferry::pipeline
{
namespace
{
constexpr auto STAGED_FILE_EXTENSION = ".part";

auto os_error_message(int error) -> std::string
{
    std::string errorMessage(BUFSIZ, '\0');

    // NOLINTNEXTLINE(*-include-cleaner)
    return ::strerror_r(error, errorMessage.data(), errorMessage.size());
}
} // namespace

StagedFile::StagedFile(
    const StagingStore&   store,
    std::filesystem::path path,
    int                   fd
)
    : m_Store(&store),
      m_Path(std::move(path)),
      m_FileDescriptor(fd),
      m_BytesWritten(0)
{
}

StagedFile::StagedFile(StagedFile&& other) noexcept
    : m_Store(std::exchange(other.m_Store, nullptr)),
      m_Path(std::exchange(other.m_Path, {})),
      m_FileDescriptor(std::exchange(other.m_FileDescriptor, -1)),
      m_BytesWritten(std::exchange(other.m_BytesWritten, 0))
{
}

auto StagedFile::operator=(StagedFile&& other) noexcept -> StagedFile&
{
    if (this != &other)
    {
        this->release();

        m_Store          = std::exchange(other.m_Store, nullptr);
        m_Path           = std::exchange(other.m_Path, {});
        m_FileDescriptor = std::exchange(other.m_FileDescriptor, -1);
        m_BytesWritten   = std::exchange(other.m_BytesWritten, 0);
    }

    return *this;
}

StagedFile::~StagedFile()
{
    this->release();
}

auto StagedFile::release() -> void
{
    this->close_descriptor();

    if (m_Store != nullptr && !m_Path.empty())
    {
        m_Store->remove(m_Path);
    }

    m_Store = nullptr;
    m_Path.clear();
}

auto StagedFile::close_descriptor() -> void
{
    if (m_FileDescriptor < 0)
    {
        return;
    }

    if (::close(m_FileDescriptor) != 0)
    {
        spdlog::warn(
            "Failed to close staged file {}! Error message: {}",
            m_Path.string(),
            os_error_message(errno)
        );
    }

    m_FileDescriptor = -1;
}

auto StagedFile::append(std::span<const char> bytes) -> void
{
    if (m_FileDescriptor < 0)
    {
        throw staging_io_error(
            std::format("Staged file {} is not open for writing", m_Path.string())
        );
    }

    while (!bytes.empty())
    {
        const ::ssize_t written
            = ::write(m_FileDescriptor, bytes.data(), bytes.size());

        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }

            throw staging_io_error(
                std::format(
                    "Failed to write to staged file {}! OS Error: {}",
                    m_Path.string(),
                    os_error_message(errno)
                )
            );
        }

        m_BytesWritten += static_cast<std::uint64_t>(written);
        bytes           = bytes.subspan(static_cast<std::size_t>(written));
    }
}

auto StagedFile::finalize() -> std::filesystem::path
{
    if (m_FileDescriptor >= 0 && ::fsync(m_FileDescriptor) != 0)
    {
        throw staging_io_error(
            std::format(
                "Failed to flush staged file {}! OS Error: {}",
                m_Path.string(),
                os_error_message(errno)
            )
        );
    }

    this->close_descriptor();

    spdlog::debug(
        "Finalized staged file {} ({} bytes)",
        m_Path.string(),
        m_BytesWritten
    );

    return m_Path;
}

StagingStore::StagingStore(std::filesystem::path directory)
    : m_Directory(std::move(directory))
{
    std::error_code errorCode;
    std::filesystem::create_directories(m_Directory, errorCode);

    if (errorCode)
    {
        throw staging_io_error(
            std::format(
                "Failed to create staging directory {}! OS Error: {}",
                m_Directory.string(),
                errorCode.message()
            )
        );
    }
}

auto StagingStore::create(std::uint64_t jobId) const -> StagedFile
{
    auto path = m_Directory / std::format("{}{}", jobId, STAGED_FILE_EXTENSION);

    // NOLINTNEXTLINE(*-vararg)
    const int fd = ::open(
        path.c_str(),
        O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
        S_IRUSR | S_IWUSR
    );

    if (fd < 0)
    {
        throw staging_io_error(
            std::format(
                "Failed to create staged file {}! OS Error: {}",
                path.string(),
                os_error_message(errno)
            )
        );
    }

    spdlog::debug("Created staged file {}", path.string());

    return StagedFile(*this, std::move(path), fd);
}

auto StagingStore::remove(const std::filesystem::path& path) const noexcept
    -> void
{
    std::error_code errorCode;
    const bool      removed = std::filesystem::remove(path, errorCode);

    if (errorCode)
    {
        spdlog::warn(
            "Failed to remove staged file {}! Error message: {}",
            path.string(),
            errorCode.message()
        );
        return;
    }

    if (removed)
    {
        spdlog::debug("Removed staged file {}", path.string());
    }
}

auto StagingStore::sweep() const -> std::size_t
{
    std::vector<std::filesystem::path> leftovers;
    std::error_code                    errorCode;

    for (const auto& entry :
         std::filesystem::directory_iterator(m_Directory, errorCode))
    {
        if (entry.is_regular_file()
            && entry.path().extension() == STAGED_FILE_EXTENSION)
        {
            leftovers.emplace_back(entry.path());
        }
    }

    if (errorCode)
    {
        spdlog::warn(
            "Failed to scan staging directory {}! Error message: {}",
            m_Directory.string(),
            errorCode.message()
        );
    }

    for (const auto& leftover : leftovers)
    {
        spdlog::info("Removing leftover staged file {}", leftover.string());
        this->remove(leftover);
    }

    return leftovers.size();
}
} // namespace ferry::pipeline
