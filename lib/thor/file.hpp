/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_FILE_HPP
#define THOR_SDK_FILE_HPP

#include <string>
#include <thor/common/bytes.hpp>

namespace thor_sdk::file {
    extern uint8_vector read(const std::string &path);
}

#endif // !THOR_SDK_FILE_HPP
