// ======================================================================
// \title  Chunk.cpp
// \brief  CFDP chunks (sparse gap tracking) logic file
//
// This file is a port of the cf_chunks.c file from the
// NASA Core Flight System (cFS) CFDP (CF) Application,
// version 3.0.0, adapted for use within cfdpd.
//
// This class handles the complexity of sparse gap tracking so that
// transactions don't need to worry about it. Receivers record arrived
// file data here and ask for the gaps when building NAK packets. Senders
// store received NAK segment requests here for re-transmit processing.
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

#include <Cfdpd/Ccsds/Cfdp/Chunk.hpp>
#include <Cfdpd/Types/Assert.hpp>

#include <algorithm>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

ChunkList::ChunkList(ChunkIdx maxChunks)
    : m_count(0), m_maxChunks(maxChunks), m_chunks(maxChunks)
{
    CFDPD_ASSERT(maxChunks > 0);
}

void ChunkList::reset()
{
    this->m_count = 0;
}

void ChunkList::add(FileSize offset, FileSize size)
{
    if (size == 0)
    {
        return;
    }

    /* files are limited to 32-bit sizes, so a wrapping segment is a caller bug */
    CFDPD_ASSERT((offset + size) > offset, offset, size);

    const Chunk chunk = {offset, size};
    const ChunkIdx i = this->findInsertPosition(chunk);
    this->insert(i, chunk);
}

const Chunk* ChunkList::getFirstChunk() const
{
    return this->m_count ? &this->m_chunks[0] : nullptr;
}

void ChunkList::removeFromFirst(FileSize size)
{
    CFDPD_ASSERT(this->m_count > 0);
    Chunk& chunk = this->m_chunks[0]; /* front is always 0 */

    if (size > chunk.size)
    {
        size = chunk.size;
    }
    chunk.size -= size;

    if (!chunk.size)
    {
        this->eraseChunk(0);
    }
    else
    {
        chunk.offset += size;
    }
}

U32 ChunkList::computeGaps(ChunkIdx maxGaps,
                           FileSize total,
                           FileSize start,
                           const GapComputeCallback& callback) const
{
    U32 ret = 0;
    ChunkIdx i = 0;
    Chunk gap;

    CFDPD_ASSERT(total > 0);
    CFDPD_ASSERT(start < total, start, total);

    if (maxGaps == 0)
    {
        return 0;
    }

    /* simple case: there is no chunk data, which means there is a single gap of the rest of the file */
    if (!this->m_count)
    {
        gap.offset = start;
        gap.size = total - start;
        if (callback)
        {
            callback(gap);
        }
        return 1;
    }

    /* Handle initial gap if needed */
    if (start < this->m_chunks[0].offset)
    {
        gap.offset = start;
        gap.size = std::min(this->m_chunks[0].offset, total) - start;
        if (callback)
        {
            callback(gap);
        }
        ret = 1;
    }

    while ((ret < maxGaps) && (i < this->m_count))
    {
        const FileSize next_off =
            (i == (this->m_count - 1)) ? total : std::min(this->m_chunks[i + 1].offset, total);
        const FileSize gap_start = this->m_chunks[i].offset + this->m_chunks[i].size;

        if (gap_start >= total)
        {
            break;
        }

        gap.offset = (gap_start > start) ? gap_start : start;
        if (start < next_off && gap.offset < next_off)
        {
            /* Only report if gap finishes after start */
            gap.size = next_off - gap.offset;
            if (callback)
            {
                callback(gap);
            }
            ++ret;
        }
        ++i;
    }

    return ret;
}

FileSize ChunkList::getCoveredSize() const
{
    FileSize covered = 0;
    for (ChunkIdx i = 0; i < this->m_count; ++i)
    {
        covered += this->m_chunks[i].size;
    }
    return covered;
}

void ChunkList::insertChunk(ChunkIdx index, const Chunk& chunk)
{
    CFDPD_ASSERT(this->m_count < this->m_maxChunks, this->m_count, this->m_maxChunks);
    CFDPD_ASSERT(index <= this->m_count, index, this->m_count);

    std::copy_backward(this->m_chunks.begin() + index, this->m_chunks.begin() + this->m_count,
                       this->m_chunks.begin() + this->m_count + 1);
    this->m_chunks[index] = chunk;

    ++this->m_count;
}

void ChunkList::eraseChunk(ChunkIdx index)
{
    CFDPD_ASSERT(this->m_count > 0);
    CFDPD_ASSERT(index < this->m_count, index, this->m_count);

    /* to erase, move the tail over the old one */
    std::copy(this->m_chunks.begin() + index + 1, this->m_chunks.begin() + this->m_count,
              this->m_chunks.begin() + index);
    --this->m_count;
}

void ChunkList::eraseRange(ChunkIdx start, ChunkIdx end)
{
    CFDPD_ASSERT(end <= this->m_count, end, this->m_count);

    if (start < end)
    {
        std::copy(this->m_chunks.begin() + end, this->m_chunks.begin() + this->m_count,
                  this->m_chunks.begin() + start);
        this->m_count = static_cast<ChunkIdx>(this->m_count - (end - start));
    }
}

ChunkIdx ChunkList::findInsertPosition(const Chunk& chunk) const
{
    ChunkIdx first = 0;
    ChunkIdx count = this->m_count;

    while (count > 0)
    {
        const ChunkIdx step = count / 2;
        const ChunkIdx i = static_cast<ChunkIdx>(first + step);
        if (this->m_chunks[i].offset < chunk.offset)
        {
            first = static_cast<ChunkIdx>(i + 1);
            count = static_cast<ChunkIdx>(count - (step + 1));
        }
        else
        {
            count = step;
        }
    }

    return first;
}

bool ChunkList::combineNext(ChunkIdx i, const Chunk& chunk)
{
    ChunkIdx combined_i = i;
    bool ret = false;
    FileSize chunk_end = chunk.offset + chunk.size;

    /* Determine how many can be combined */
    for (; combined_i < this->m_count; ++combined_i)
    {
        /* Advance combine index until there is a gap between end and the next offset */
        if (chunk_end < this->m_chunks[combined_i].offset)
        {
            break;
        }
    }

    /* If index advanced the range of chunks can be combined */
    if (i != combined_i)
    {
        /* End is the max of last combined chunk end or new chunk end */
        const Chunk& last = this->m_chunks[combined_i - 1];
        chunk_end = std::max(last.offset + last.size, chunk_end);

        /* Use current slot as combined entry */
        this->m_chunks[i].size = chunk_end - chunk.offset;
        this->m_chunks[i].offset = chunk.offset;

        /* Erase the rest of the combined chunks (if any) */
        this->eraseRange(static_cast<ChunkIdx>(i + 1), combined_i);
        ret = true;
    }

    return ret;
}

bool ChunkList::combinePrevious(ChunkIdx i, const Chunk& chunk)
{
    bool ret = false;

    CFDPD_ASSERT(i <= this->m_maxChunks, i, this->m_maxChunks);

    /* Only need to check if there is a previous */
    if (i > 0)
    {
        const FileSize chunk_end = chunk.offset + chunk.size;
        Chunk& prev = this->m_chunks[i - 1];
        const FileSize prev_end = prev.offset + prev.size;

        /* Check if start of new chunk is less than end of previous (overlaps) */
        if (chunk.offset <= prev_end)
        {
            /* When combining, use the bigger of the two endings */
            if (prev_end < chunk_end)
            {
                prev.size = chunk_end - prev.offset;
            }
            ret = true;
        }
    }
    return ret;
}

void ChunkList::insert(ChunkIdx i, const Chunk& chunk)
{
    if (this->combineNext(i, chunk))
    {
        const Chunk merged = this->m_chunks[i];
        if (this->combinePrevious(i, merged))
        {
            this->eraseChunk(i);
        }
    }
    else if (!this->combinePrevious(i, chunk))
    {
        if (this->m_count < this->m_maxChunks)
        {
            this->insertChunk(i, chunk);
        }
        else
        {
            const ChunkIdx smallest_i = this->findSmallestSize();
            if (this->m_chunks[smallest_i].size < chunk.size)
            {
                this->eraseChunk(smallest_i);
                this->insertChunk(this->findInsertPosition(chunk), chunk);
            }
        }
    }
}

ChunkIdx ChunkList::findSmallestSize() const
{
    ChunkIdx smallest = 0;

    for (ChunkIdx i = 1; i < this->m_count; ++i)
    {
        if (this->m_chunks[i].size < this->m_chunks[smallest].size)
        {
            smallest = i;
        }
    }

    return smallest;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd
