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

#ifndef DFE_CORE_INCLUDE_WINDOWING_RUNTIME_KEYEDWINDOWPROCESSOR_HPP_
#define DFE_CORE_INCLUDE_WINDOWING_RUNTIME_KEYEDWINDOWPROCESSOR_HPP_

#include <Exceptions/ProcessingFailure.hpp>
#include <Operators/UserFunctions.hpp>
#include <State/KeyedWindowStateStore.hpp>
#include <State/StateSerde.hpp>
#include <Windowing/WindowTypes/WindowingStrategy.hpp>
#include <Windowing/WindowedElement.hpp>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace DFE::Windowing {

/**
 * @brief Runs the keyed, windowed aggregation of one partition.
 * Every element is assigned to its windows, merges of a merging strategy are applied to the state of the key,
 * and the value of the element is folded into the accumulator of every resolved window.
 * A watermark fires every window that ends at or before it.
 *
 * Failures of a single key are contained:
 * an inconsistent merge abandons the key, a corrupted spilled entry restarts the entry from a fresh accumulator.
 * Both are reported to the failure listener. Failures of the spill storage are propagated.
 */
class KeyedWindowProcessor {
  public:
    /**
     * @brief Creates the processor.
     * @param operatorName name of the operator, used in failure reports
     * @param windowing the windowing strategy, nullptr to keep the windows attached to the elements
     * @param keyExtractor extracts the key of an element
     * @param valueExtractor extracts the value that is folded into the accumulator
     * @param functions accumulator functions
     * @param keySerde encodes keys, the encoded bytes identify a key
     * @param store the state store of this partition
     * @param failureListener receives contained failures
     */
    KeyedWindowProcessor(std::string operatorName,
                         WindowingStrategyPtr windowing,
                         KeyExtractor keyExtractor,
                         ValueExtractor valueExtractor,
                         AccumulatorFunctions functions,
                         State::StateSerdePtr keySerde,
                         State::KeyedWindowStateStorePtr store,
                         Exceptions::FailureListener failureListener);

    /**
     * @brief Processes one element.
     * Elements whose windows all fired already are dropped as late elements.
     * @param element the element
     * @throws SpillIOException if the spill storage fails
     */
    void onElement(const WindowedElement& element);

    /**
     * @brief Fires all windows that end at or before the watermark, in window order.
     * Each flushed value is emitted as KeyValue(key, value) with the max timestamp of its window.
     * @param watermark the new watermark
     * @return the emitted elements
     * @throws SpillIOException if the spill storage fails
     */
    std::vector<WindowedElement> onWatermark(uint64_t watermark);

    [[nodiscard]] uint64_t getLastWatermark() const { return lastWatermark; }

    [[nodiscard]] uint64_t getNumberOfDroppedLateElements() const { return droppedLateElements; }

    /**
     * @brief Returns the open windows of a key in ascending order.
     */
    [[nodiscard]] std::vector<Window> getTrackedWindows(const std::any& key) const;

    /**
     * @brief Checks if the key was abandoned after an inconsistent merge.
     */
    [[nodiscard]] bool isAbandoned(const std::any& key) const;

  private:
    struct TrackedKey {
        std::any key;
        std::set<Window> windows;
    };

    std::vector<Window> resolveMerges(const std::string& keyBytes, const std::any& key, const std::vector<Window>& candidates);
    void fold(const std::string& keyBytes, const std::any& key, const Window& window, const std::any& value);
    void track(const std::string& keyBytes, const std::any& key, const Window& window);
    void untrack(const std::string& keyBytes, const Window& window);
    void abandonKey(const std::string& keyBytes, const std::any& key);
    void reportFailure(Exceptions::FailureKind kind, const std::any& key, std::optional<Window> window, const std::string& message);

    const std::string operatorName;
    const WindowingStrategyPtr windowing;
    const KeyExtractor keyExtractor;
    const ValueExtractor valueExtractor;
    const AccumulatorFunctions functions;
    const State::StateSerdePtr keySerde;
    const State::KeyedWindowStateStorePtr store;
    const Exceptions::FailureListener failureListener;

    std::unordered_map<std::string, TrackedKey> trackedKeys;
    std::map<Window, std::set<std::string>> openWindows;
    std::unordered_set<std::string> abandonedKeys;
    uint64_t lastWatermark = 0;
    uint64_t droppedLateElements = 0;
};

}// namespace DFE::Windowing

#endif// DFE_CORE_INCLUDE_WINDOWING_RUNTIME_KEYEDWINDOWPROCESSOR_HPP_
