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

#include <Exceptions/SpillIOException.hpp>
#include <State/FileSpillStorage.hpp>
#include <Util/Logger/Logger.hpp>
#include <atomic>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace DFE::State {

FileSpillStorage::FileSpillStorage(std::filesystem::path directory) : directory(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(this->directory, ec);
    if (ec) {
        throw Exceptions::SpillIOException("cannot create spill directory " + this->directory.string() + ": " + ec.message());
    }
    DFE_DEBUG2("FileSpillStorage: created spill directory {}", this->directory.string());
}

FileSpillStorage::~FileSpillStorage() {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if (ec) {
        DFE_WARNING2("FileSpillStorage: cannot remove spill directory {}: {}", directory.string(), ec.message());
    }
}

std::filesystem::path FileSpillStorage::pathOf(const std::string& recordId) const { return directory / (recordId + ".spill"); }

void FileSpillStorage::write(const std::string& recordId, const std::string& bytes) {
    auto path = pathOf(recordId);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Exceptions::SpillIOException("cannot open spill file " + path.string() + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw Exceptions::SpillIOException("cannot write " + std::to_string(bytes.size()) + " bytes to spill file " + path.string());
    }
    DFE_TRACE2("FileSpillStorage: wrote {} bytes to {}", bytes.size(), path.string());
}

std::string FileSpillStorage::read(const std::string& recordId) {
    auto path = pathOf(recordId);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Exceptions::SpillIOException("cannot open spill file " + path.string() + " for reading");
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Exceptions::SpillIOException("cannot read spill file " + path.string());
    }
    return bytes;
}

void FileSpillStorage::remove(const std::string& recordId) {
    auto path = pathOf(recordId);
    std::error_code ec;
    if (!std::filesystem::remove(path, ec) || ec) {
        throw Exceptions::SpillIOException("cannot remove spill file " + path.string()
                                           + (ec ? ": " + ec.message() : ": file does not exist"));
    }
}

FileSpillStorageFactory::FileSpillStorageFactory(std::filesystem::path baseDirectory) : baseDirectory(std::move(baseDirectory)) {}

SpillStorageFactoryPtr FileSpillStorageFactory::create(const std::filesystem::path& baseDirectory) {
    return std::make_shared<FileSpillStorageFactory>(baseDirectory);
}

SpillStoragePtr FileSpillStorageFactory::create() {
    static std::atomic<uint64_t> storageCounter{0};
    auto name = "spill-" + std::to_string(::getpid()) + "-" + std::to_string(storageCounter++);
    return std::make_shared<FileSpillStorage>(baseDirectory / name);
}

}// namespace DFE::State
