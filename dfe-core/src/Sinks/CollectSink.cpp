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

#include <Sinks/CollectSink.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Sinks {

class CollectSinkWriter : public SinkWriter {
  public:
    explicit CollectSinkWriter(CollectSinkPtr sink) : sink(std::move(sink)) {}

    void write(const std::any& value) override { buffer.emplace_back(value); }

    void commit() override {
        sink->values.insert(sink->values.end(), buffer.begin(), buffer.end());
        buffer.clear();
    }

    void rollback() override { buffer.clear(); }

  private:
    CollectSinkPtr sink;
    std::vector<std::any> buffer;
};

CollectSinkPtr CollectSink::create() { return std::make_shared<CollectSink>(); }

SinkWriterPtr CollectSink::openWriter(uint64_t partitionId) {
    DFE_DEBUG2("CollectSink: open writer for partition {}", partitionId);
    return std::make_shared<CollectSinkWriter>(shared_from_this());
}

void CollectSink::commit() { committed = true; }

void CollectSink::rollback() {
    rolledBack = true;
    values.clear();
}

std::string CollectSink::toString() const { return "CollectSink(" + std::to_string(values.size()) + " values)"; }

}// namespace DFE::Sinks
