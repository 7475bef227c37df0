#pragma once

namespace buildprof {

enum class ChangeKind {
    Created,
    Modified
};

} // namespace buildprof
