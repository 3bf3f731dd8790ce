/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#ifndef DFE_CORE_INCLUDE_SINKS_DATASINK_HPP_
#define DFE_CORE_INCLUDE_SINKS_DATASINK_HPP_

#include <any>
#include <cstdint>
#include <memory>
#include <string>

namespace DFE::Sinks {

class SinkWriter;
using SinkWriterPtr = std::shared_ptr<SinkWriter>;

/**
 * @brief Writes the elements of one partition into a sink.
 * Written elements become visible with commit and are discarded with rollback.
 */
class SinkWriter {
  public:
    virtual ~SinkWriter() = default;

    virtual void write(const std::any& value) = 0;

    virtual void commit() = 0;

    virtual void rollback() = 0;
};

class DataSink;
using DataSinkPtr = std::shared_ptr<DataSink>;

/**
 * @brief Receives the plain values of a leaf operator. Physical I/O is implemented by backends.
 */
class DataSink {
  public:
    virtual ~DataSink() = default;

    /**
     * @brief Opens the writer of a partition.
     * @param partitionId the partition
     * @return writer
     */
    virtual SinkWriterPtr openWriter(uint64_t partitionId) = 0;

    /**
     * @brief Called once all writers of the sink committed.
     */
    virtual void commit() {}

    /**
     * @brief Called if the output of the sink could not be produced.
     */
    virtual void rollback() {}

    [[nodiscard]] virtual std::string toString() const = 0;
};

}// namespace DFE::Sinks

#endif// DFE_CORE_INCLUDE_SINKS_DATASINK_HPP_
