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

#include <Exceptions/MergeConsistencyException.hpp>
#include <Exceptions/StateCorruptionException.hpp>
#include <Util/AnyUtil.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Runtime/KeyedWindowProcessor.hpp>
#include <algorithm>

namespace DFE::Windowing {

KeyedWindowProcessor::KeyedWindowProcessor(std::string operatorName,
                                           WindowingStrategyPtr windowing,
                                           KeyExtractor keyExtractor,
                                           ValueExtractor valueExtractor,
                                           AccumulatorFunctions functions,
                                           State::StateSerdePtr keySerde,
                                           State::KeyedWindowStateStorePtr store,
                                           Exceptions::FailureListener failureListener)
    : operatorName(std::move(operatorName)), windowing(std::move(windowing)), keyExtractor(std::move(keyExtractor)),
      valueExtractor(std::move(valueExtractor)), functions(std::move(functions)), keySerde(std::move(keySerde)),
      store(std::move(store)), failureListener(std::move(failureListener)) {
    DFE_ASSERT(this->store, "KeyedWindowProcessor requires a state store");
    DFE_ASSERT(this->keySerde, "KeyedWindowProcessor requires a key serde");
}

void KeyedWindowProcessor::onElement(const WindowedElement& element) {
    auto key = keyExtractor(element.getValue());
    auto keyBytes = keySerde->serialize(key);
    if (abandonedKeys.contains(keyBytes)) {
        DFE_TRACE2("KeyedWindowProcessor {}: ignore element of abandoned key {}", operatorName, Util::anyToString(key));
        return;
    }

    auto windows = WindowingStrategy::assignOrInherit(windowing, element);
    if (windows.empty()) {
        // sliding windows with a slide larger than their size leave gaps, elements in a gap belong to no window
        DFE_TRACE2("KeyedWindowProcessor {}: element with timestamp {} falls into no window", operatorName, element.getTimestamp());
        return;
    }
    std::erase_if(windows, [this](const Window& window) {
        return window.getEnd() <= lastWatermark;
    });
    if (windows.empty()) {
        ++droppedLateElements;
        DFE_DEBUG2("KeyedWindowProcessor {}: drop late element with timestamp {} at watermark {}",
                   operatorName,
                   element.getTimestamp(),
                   lastWatermark);
        return;
    }

    if (windowing && windowing->isMerging()) {
        try {
            windows = resolveMerges(keyBytes, key, windows);
        } catch (const Exceptions::MergeConsistencyException& e) {
            reportFailure(Exceptions::FailureKind::MERGE_CONSISTENCY, key, e.getWindow(), e.what());
            abandonKey(keyBytes, key);
            return;
        }
    }

    auto value = valueExtractor(element.getValue());
    for (const auto& window : windows) {
        fold(keyBytes, key, window, value);
    }
}

std::vector<Window>
KeyedWindowProcessor::resolveMerges(const std::string& keyBytes, const std::any& key, const std::vector<Window>& candidates) {
    std::set<Window> tracked;
    if (auto it = trackedKeys.find(keyBytes); it != trackedKeys.end()) {
        tracked = it->second.windows;
    }
    std::set<Window> known = tracked;
    known.insert(candidates.begin(), candidates.end());

    auto merges = windowing->mergeWindows(std::vector<Window>(known.begin(), known.end()));
    // validate all merges before the state of the key is touched
    for (const auto& mergeSet : merges) {
        for (const auto& source : mergeSet.getSources()) {
            if (!known.contains(source)) {
                throw Exceptions::MergeConsistencyException(Util::anyToString(key), source);
            }
        }
    }

    std::map<Window, Window> redirects;
    for (const auto& mergeSet : merges) {
        const auto& target = mergeSet.getMergedWindow();
        DFE_DEBUG2("KeyedWindowProcessor {}: apply {} for key {}", operatorName, mergeSet.toString(), Util::anyToString(key));
        for (const auto& source : mergeSet.getSources()) {
            if (source == target) {
                continue;
            }
            redirects.insert_or_assign(source, target);
            if (!tracked.contains(source)) {
                continue;
            }
            track(keyBytes, key, target);
            try {
                store->relocate(key, source, target);
            } catch (const Exceptions::StateCorruptionException& e) {
                reportFailure(Exceptions::FailureKind::STATE_CORRUPTION, key, source, e.what());
            }
            untrack(keyBytes, source);
        }
    }

    std::set<Window> resolved;
    for (const auto& candidate : candidates) {
        auto redirect = redirects.find(candidate);
        resolved.insert(redirect == redirects.end() ? candidate : redirect->second);
    }
    return {resolved.begin(), resolved.end()};
}

void KeyedWindowProcessor::fold(const std::string& keyBytes, const std::any& key, const Window& window, const std::any& value) {
    track(keyBytes, key, window);
    try {
        auto& accumulator = store->getOrCreate(key, window);
        accumulator = functions.add(accumulator, value);
    } catch (const Exceptions::StateCorruptionException& e) {
        // the store dropped the corrupted entry, so the value starts a fresh accumulator
        reportFailure(Exceptions::FailureKind::STATE_CORRUPTION, key, window, e.what());
        auto& accumulator = store->getOrCreate(key, window);
        accumulator = functions.add(accumulator, value);
    }
}

std::vector<WindowedElement> KeyedWindowProcessor::onWatermark(uint64_t watermark) {
    std::vector<WindowedElement> output;
    if (watermark <= lastWatermark) {
        return output;
    }
    lastWatermark = watermark;

    std::vector<Window> dueWindows;
    for (const auto& [window, keys] : openWindows) {
        if (window.getEnd() <= watermark) {
            dueWindows.emplace_back(window);
        }
    }

    for (const auto& window : dueWindows) {
        auto keys = openWindows.at(window);
        for (const auto& keyBytes : keys) {
            auto key = trackedKeys.at(keyBytes).key;
            untrack(keyBytes, window);
            if (!store->contains(key, window)) {
                continue;
            }
            std::any accumulator;
            try {
                accumulator = store->getOrCreate(key, window);
            } catch (const Exceptions::StateCorruptionException& e) {
                reportFailure(Exceptions::FailureKind::STATE_CORRUPTION, key, window, e.what());
                continue;
            }
            store->remove(key, window);

            VectorCollector collector;
            functions.flush(key, accumulator, collector);
            for (auto& value : collector.release()) {
                output.emplace_back(KeyValue(key, std::move(value)), window.maxTimestamp(), std::vector<Window>{window});
            }
        }
    }
    DFE_DEBUG2("KeyedWindowProcessor {}: watermark {} fired {} windows and emitted {} elements",
               operatorName,
               watermark,
               dueWindows.size(),
               output.size());
    return output;
}

void KeyedWindowProcessor::track(const std::string& keyBytes, const std::any& key, const Window& window) {
    auto [it, inserted] = trackedKeys.try_emplace(keyBytes, TrackedKey{key, {}});
    it->second.windows.insert(window);
    openWindows[window].insert(keyBytes);
}

void KeyedWindowProcessor::untrack(const std::string& keyBytes, const Window& window) {
    if (auto it = trackedKeys.find(keyBytes); it != trackedKeys.end()) {
        it->second.windows.erase(window);
        if (it->second.windows.empty()) {
            trackedKeys.erase(it);
        }
    }
    if (auto it = openWindows.find(window); it != openWindows.end()) {
        it->second.erase(keyBytes);
        if (it->second.empty()) {
            openWindows.erase(it);
        }
    }
}

void KeyedWindowProcessor::abandonKey(const std::string& keyBytes, const std::any& key) {
    if (auto it = trackedKeys.find(keyBytes); it != trackedKeys.end()) {
        auto windows = it->second.windows;
        for (const auto& window : windows) {
            untrack(keyBytes, window);
        }
    }
    store->removeKey(key);
    abandonedKeys.insert(keyBytes);
    DFE_WARNING2("KeyedWindowProcessor {}: abandoned key {}", operatorName, Util::anyToString(key));
}

std::vector<Window> KeyedWindowProcessor::getTrackedWindows(const std::any& key) const {
    auto it = trackedKeys.find(keySerde->serialize(key));
    if (it == trackedKeys.end()) {
        return {};
    }
    return std::vector<Window>(it->second.windows.begin(), it->second.windows.end());
}

bool KeyedWindowProcessor::isAbandoned(const std::any& key) const { return abandonedKeys.contains(keySerde->serialize(key)); }

void KeyedWindowProcessor::reportFailure(Exceptions::FailureKind kind,
                                         const std::any& key,
                                         std::optional<Window> window,
                                         const std::string& message) {
    Exceptions::ProcessingFailure failure{kind, operatorName, Util::anyToString(key), window, message};
    DFE_WARNING2("KeyedWindowProcessor: {}", failure.toString());
    if (failureListener) {
        failureListener(failure);
    }
}

}// namespace DFE::Windowing
