// ======================================================================
// \title  Chunk.hpp
// \brief  CFDP chunks (sparse gap tracking) header file
//
// This file is a port of CFDP chunk/gap tracking from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_chunks.h (CFDP chunk and gap tracking definitions)
//
// ======================================================================
//
// NASA Docket No. GSC-18,447-1
//
// Copyright (c) 2019 United States Government as represented by the
// Administrator of the National Aeronautics and Space Administration.
// All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may
// not use this file except in compliance with the License. You may obtain
// a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Chunk_HPP
#define Cfdpd_Ccsds_Cfdp_Chunk_HPP

#include <functional>
#include <vector>

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

typedef U16 ChunkIdx;

/**
 * @brief Pairs an offset with a size to identify a specific piece of a file
 */
struct Chunk
{
    FileSize offset; /**< \brief The start offset of the chunk within the file */
    FileSize size;   /**< \brief The size of the chunk */
};

/**
 * @brief Callback type for gap computation
 *
 * Invoked by ChunkList::computeGaps() once per gap found.
 */
typedef std::function<void(const Chunk& gap)> GapComputeCallback;

/**
 * @brief Offset-sorted list of file segments
 *
 * The chunk list maintains file segments in offset-sorted order and merges
 * overlapping or adjacent segments as they are added. It is used for:
 * - RX transactions: Track received file data segments to identify gaps for NAK packets
 * - TX transactions: Track NAK segment requests for retransmission
 *
 * The capacity is fixed at construction. When the list is full, adding a
 * segment evicts the smallest one if the new segment is larger.
 */
class ChunkList {
  public:
    /**
     * @brief Constructor
     *
     * @param maxChunks  Maximum number of chunks this list can hold
     */
    explicit ChunkList(ChunkIdx maxChunks);

    /**
     * @brief Add a chunk (file segment) to the list
     *
     * The chunk is combined with overlapping or contiguous neighbors. A
     * zero-size chunk is ignored.
     *
     * @param offset  Starting offset of the chunk within the file
     * @param size    Size of the chunk in bytes
     */
    void add(FileSize offset, FileSize size);

    /**
     * @brief Reset the chunk list to empty state
     */
    void reset();

    /**
     * @brief Get the first chunk in the list
     *
     * @returns Pointer to the first chunk
     * @retval  nullptr if the list is empty
     */
    const Chunk* getFirstChunk() const;

    /**
     * @brief Remove a specified size from the first chunk
     *
     * Reduces the size of the first chunk by the specified amount. If the
     * size covers the chunk, the entire chunk is removed.
     *
     * @param size  Number of bytes to remove from the first chunk
     *
     * @note The list must not be empty when calling this function
     */
    void removeFromFirst(FileSize size);

    /**
     * @brief Compute gaps between chunks and invoke callback for each
     *
     * Reports the holes in [start, total) in offset order.
     *
     * @param maxGaps    Maximum number of gaps to compute
     * @param total      Total size of the file, must be nonzero
     * @param start      Starting offset for gap computation, less than total
     * @param callback   Callback function to invoke for each gap, may be empty
     *
     * @returns Number of gaps computed
     */
    U32 computeGaps(ChunkIdx maxGaps, FileSize total, FileSize start, const GapComputeCallback& callback) const;

    /**
     * @brief Total number of bytes covered by the list
     */
    FileSize getCoveredSize() const;

    /**
     * @brief Get the current number of chunks in the list
     */
    ChunkIdx getCount() const { return this->m_count; }

    /**
     * @brief Get the maximum number of chunks this list can hold
     */
    ChunkIdx getMaxChunks() const { return this->m_maxChunks; }

  private:
    void insertChunk(ChunkIdx index, const Chunk& chunk);
    void eraseChunk(ChunkIdx index);
    void eraseRange(ChunkIdx start, ChunkIdx end);
    ChunkIdx findInsertPosition(const Chunk& chunk) const;
    bool combineNext(ChunkIdx i, const Chunk& chunk);
    bool combinePrevious(ChunkIdx i, const Chunk& chunk);
    void insert(ChunkIdx i, const Chunk& chunk);
    ChunkIdx findSmallestSize() const;

  private:
    ChunkIdx m_count;             //!< Current number of chunks in the list
    ChunkIdx m_maxChunks;         //!< Maximum number of chunks allowed
    std::vector<Chunk> m_chunks;  //!< Chunk storage, m_maxChunks entries
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Chunk_HPP
