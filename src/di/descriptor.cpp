#include "weave/di/descriptor.hpp"

namespace weave::di {

void DescriptorTable::add(TypeDescriptor descriptor) {
    auto type = descriptor.type;
    descriptors_.insert_or_assign(type, std::move(descriptor));
}

bool DescriptorTable::add_default(TypeDescriptor descriptor) {
    auto type = descriptor.type;
    return descriptors_.try_emplace(type, std::move(descriptor)).second;
}

const TypeDescriptor* DescriptorTable::find_descriptor(
    std::type_index type) const {
    auto it = descriptors_.find(type);
    return it == descriptors_.end() ? nullptr : &it->second;
}

bool DescriptorTable::contains(std::type_index type) const {
    return descriptors_.find(type) != descriptors_.end();
}

}  // namespace weave::di
