/**
 * @file StagingStore.hpp
 * @brief Local scratch files holding a job's payload between stages
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace ferry::pipeline
{
class StagingStore;

/**
 * @brief Scoped owner of one staged file. The file is removed when the
 *        handle is destroyed, whatever the outcome of the job.
 */
class StagedFile
{
  public: // Constructors
    StagedFile(StagedFile&) = delete;
    StagedFile(StagedFile&& other) noexcept;
    auto operator=(StagedFile&) -> StagedFile = delete;
    auto operator=(StagedFile&& other) noexcept -> StagedFile&;

    ~StagedFile();

  public: // Methods
    auto append(std::span<const char> bytes) -> void;

    /**
     * @brief Flushes and closes the file. No more appends are accepted.
     * @return Path of the completed staged file
     */
    auto finalize() -> std::filesystem::path;

    [[nodiscard]]
    auto path() const -> const std::filesystem::path&
    {
        return m_Path;
    }

    [[nodiscard]]
    auto bytes_written() const -> std::uint64_t
    {
        return m_BytesWritten;
    }

  private: // Constructors
    friend class StagingStore;
    StagedFile(const StagingStore& store, std::filesystem::path path, int fd);

  private: // Methods
    auto close_descriptor() -> void;
    auto release() -> void;

  private: // Members
    const StagingStore*   m_Store;
    std::filesystem::path m_Path;
    int                   m_FileDescriptor;
    std::uint64_t         m_BytesWritten;
};

class StagingStore
{
  public: // Constructors
    explicit StagingStore(std::filesystem::path directory);

  public: // Methods
    [[nodiscard]]
    auto create(std::uint64_t jobId) const -> StagedFile;

    /**
     * @brief Deletes a staged file. Safe on paths that no longer exist;
     *        failures are logged, never thrown.
     */
    auto remove(const std::filesystem::path& path) const noexcept -> void;

    /**
     * @brief Deletes staged files left behind by a previous run.
     * @return Number of files removed
     */
    auto sweep() const -> std::size_t;

    [[nodiscard]]
    auto directory() const -> const std::filesystem::path&
    {
        return m_Directory;
    }

  private: // Members
    std::filesystem::path m_Directory;
};
} // namespace ferry::pipeline
