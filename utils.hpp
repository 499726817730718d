/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct InvalidUtf8 {
    size_t line_number; // 1-based
};

typedef std::variant<std::vector<std::string>, InvalidUtf8> ReadResult;

bool is_separator(char c);

std::vector<std::string> split_to_words(std::string_view in_text);

// Number of code points, not bytes.
size_t utf8_length(std::string_view text);

ReadResult read_words(std::istream &input);
