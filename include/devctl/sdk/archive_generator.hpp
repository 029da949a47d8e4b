//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_ARCHIVE_GENERATOR_HPP_INCLUDED
#define DEVCTL_SDK_ARCHIVE_GENERATOR_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace devctl
{
namespace sdk
{

/// Lazy, finite and non-restartable sequence of byte chunks.
///
/// Pulling never blocks: if the next chunk is not ready yet, the source says where to await it.
///
class ChunkSource
{
public:
    using Ptr = std::unique_ptr<ChunkSource>;

    // No copy/move semantics.
    ChunkSource(ChunkSource&&)                 = delete;
    ChunkSource(const ChunkSource&)            = delete;
    ChunkSource& operator=(ChunkSource&&)      = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    virtual ~ChunkSource() = default;

    struct Next final
    {
        using Chunk = std::vector<std::uint8_t>;
        struct End final
        {};
        /// Nothing is ready yet. Pull again once `fd` becomes readable,
        /// or (if `fd` is negative) after a short while.
        struct Pending final
        {
            int fd;
        };
        using Failure = int;  // `errno`-like error code
        using Result  = cetl::variant<Chunk, Pending, End, Failure>;
    };
    /// Pulls the next chunk. Once `End` or `Failure` is returned, the source is exhausted.
    ///
    virtual Next::Result next() = 0;

protected:
    ChunkSource() = default;

};  // ChunkSource

/// Produces an archive of local files and directories as a chunk source.
///
class ArchiveGenerator
{
public:
    using Ptr = std::shared_ptr<ArchiveGenerator>;

    /// Maximum size of a single chunk (matches capacity of the upload chunk message).
    static constexpr std::size_t MaxChunkSize = 16384;

    /// Makes generator which archives with the system `tar` tool.
    ///
    CETL_NODISCARD static Ptr make();

    // No copy/move semantics.
    ArchiveGenerator(ArchiveGenerator&&)                 = delete;
    ArchiveGenerator(const ArchiveGenerator&)            = delete;
    ArchiveGenerator& operator=(ArchiveGenerator&&)      = delete;
    ArchiveGenerator& operator=(const ArchiveGenerator&) = delete;

    virtual ~ArchiveGenerator() = default;

    /// Starts archiving of the given paths.
    ///
    /// @param place_in_subfolders If `true`, every path is archived under its own numbered subfolder,
    ///                            so that equally named items from different locations do not collide.
    /// @return Chunk source of the archive bytes. Failures to start archiving are reported by the source.
    ///
    virtual ChunkSource::Ptr generate(const std::vector<std::string>& paths, const bool place_in_subfolders) = 0;

protected:
    ArchiveGenerator() = default;

};  // ArchiveGenerator

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_ARCHIVE_GENERATOR_HPP_INCLUDED
