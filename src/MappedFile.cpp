#include "MappedFile.hpp"
#include <algorithm>
#include <filesystem>

MappedFile::MappedFile(const std::string& path)
    : mappedSize(std::filesystem::file_size(path)) {
    if (mappedSize > 0) {
        boost::interprocess::file_mapping mapping(path.c_str(), boost::interprocess::read_only);
        boost::interprocess::mapped_region mapped(mapping, boost::interprocess::read_only);
        fileMapping.swap(mapping);
        region.swap(mapped);
        mappedSize = region.get_size();
    }
}

MappedFile::~MappedFile() {}

size_t MappedFile::size() const {
    return mappedSize;
}

const char* MappedFile::data() const {
    return static_cast<const char*>(region.get_address());
}

std::string_view MappedFile::view(size_t offset, size_t length) const {
    if (offset >= mappedSize) {
        return {};
    }
    return std::string_view(data() + offset, std::min(length, mappedSize - offset));
}
