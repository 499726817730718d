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

#include <utils.hpp>
#include <glib.h>
#include <iterator>

bool is_separator(char c) {
    switch(c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\v':
    case '\f':
        return true;
    default:
        return false;
    }
}

std::vector<std::string> split_to_words(std::string_view in_text) {
    std::vector<std::string> words;
    size_t i = 0;
    while(i < in_text.size()) {
        while(i < in_text.size() && is_separator(in_text[i])) {
            ++i;
        }
        const size_t word_start = i;
        while(i < in_text.size() && !is_separator(in_text[i])) {
            ++i;
        }
        if(i > word_start) {
            words.emplace_back(in_text.substr(word_start, i - word_start));
        }
    }
    return words;
}

size_t utf8_length(std::string_view text) {
    // Bounded by byte count so a truncated sequence can not run past the end.
    return size_t(g_utf8_strlen(text.data(), gssize(text.size())));
}

ReadResult read_words(std::istream &input) {
    std::vector<std::string> words;
    size_t line_number = 0;
    for(std::string line; std::getline(input, line);) {
        ++line_number;
        if(!g_utf8_validate(line.c_str(), line.length(), nullptr)) {
            return InvalidUtf8{line_number};
        }
        auto line_words = split_to_words(line);
        words.insert(words.end(),
                     std::make_move_iterator(line_words.begin()),
                     std::make_move_iterator(line_words.end()));
    }
    return words;
}
