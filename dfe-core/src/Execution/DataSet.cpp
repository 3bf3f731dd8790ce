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

#include <Execution/DataSet.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Execution {

DataSet::DataSet(std::string name, Producer producer) : name(std::move(name)), producer(std::move(producer)) {
    DFE_ASSERT(this->producer, "DataSet " << this->name << " requires a producer");
}

DataSetPtr DataSet::create(std::string name, Producer producer) {
    return std::make_shared<DataSet>(std::move(name), std::move(producer));
}

std::vector<Windowing::WindowedElement> DataSet::compute() {
    if (cache) {
        DFE_TRACE("DataSet " << name << ": reuse persisted result");
        return *cache;
    }
    ++computations;
    auto elements = producer();
    DFE_DEBUG2("DataSet {}: computed {} elements", name, elements.size());
    if (persisted) {
        cache = elements;
    }
    return elements;
}

void DataSet::persist() {
    DFE_DEBUG("DataSet " << name << ": persist");
    persisted = true;
}

}// namespace DFE::Execution
