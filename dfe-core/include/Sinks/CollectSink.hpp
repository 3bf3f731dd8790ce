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

#ifndef DFE_CORE_INCLUDE_SINKS_COLLECTSINK_HPP_
#define DFE_CORE_INCLUDE_SINKS_COLLECTSINK_HPP_

#include <Sinks/DataSink.hpp>
#include <memory>
#include <vector>

namespace DFE::Sinks {

class CollectSink;
using CollectSinkPtr = std::shared_ptr<CollectSink>;

/**
 * @brief Sink that keeps all committed values in memory.
 */
class CollectSink : public DataSink, public std::enable_shared_from_this<CollectSink> {
  public:
    static CollectSinkPtr create();

    SinkWriterPtr openWriter(uint64_t partitionId) override;

    void commit() override;

    void rollback() override;

    [[nodiscard]] const std::vector<std::any>& getValues() const { return values; }

    [[nodiscard]] bool isCommitted() const { return committed; }

    [[nodiscard]] bool isRolledBack() const { return rolledBack; }

    [[nodiscard]] std::string toString() const override;

  private:
    friend class CollectSinkWriter;

    std::vector<std::any> values;
    bool committed = false;
    bool rolledBack = false;
};

}// namespace DFE::Sinks

#endif// DFE_CORE_INCLUDE_SINKS_COLLECTSINK_HPP_
