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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Slack squared stays far below the int64_t limit up to this width.
const int64_t max_line_width = 1000000;

enum class JustifyError : int {
    InvalidWidth,
    WidthTooLarge,
    MalformedWord,
};

const char *error_text(JustifyError e);

enum class BreakStrategy : int {
    Optimal,
    Greedy,
};

// clang-format off

/*
 * Lines are half open ranges of word indices.
 *
 * 0    1    2    3
 * |    |    |    |
 * V    V    V    V
 * foo  bar  baz
 *
 * The line "foo bar" is [0, 2).
 *
 * The end index _can_ point one-past-the-end.
 *
 * The begin index can _not_ point one-past-the-end.
 */

// clang-format on

struct LineSpan {
    size_t begin;
    size_t end;
    int64_t badness;

    size_t num_words() const { return end - begin; }

    bool operator==(const LineSpan &o) const {
        return begin == o.begin && end == o.end && badness == o.badness;
    }
};

struct Partition {
    std::vector<LineSpan> lines;
    int64_t total_badness = 0;
};

typedef std::variant<Partition, JustifyError> PartitionResult;
typedef std::variant<std::vector<std::string>, JustifyError> JustifyResult;

class Justifier {
public:
    Justifier(const std::vector<std::string> &words_, int64_t target_width);

    PartitionResult partition(BreakStrategy strategy) const;
    PartitionResult optimal_partition() const;
    PartitionResult greedy_partition() const;

    std::vector<std::string> build_lines(const Partition &p) const;
    std::vector<std::string> build_padded_lines(const Partition &p) const;

    // Words plus one space between each pair.
    int64_t raw_length(size_t begin, size_t end) const;

    // Empty if the words do not fit on one line or the input is rejected.
    // A lone word wider than the line is forced through with zero badness,
    // as is the last line.
    std::optional<int64_t> line_badness(size_t begin, size_t end) const;

    size_t num_words() const { return words.size(); }
    int64_t word_length(size_t i) const { return lengths[i]; }
    int64_t width() const { return line_width; }

private:
    void precompute();
    std::optional<JustifyError> check_input() const;
    LineSpan make_span(size_t begin, size_t end) const;
    std::string build_line(const LineSpan &span) const;
    std::string build_padded_line(const LineSpan &span) const;

    std::vector<std::string> words;
    int64_t line_width;
    std::vector<int64_t> lengths;
    std::vector<int64_t> length_prefix; // Sum of lengths of words [0, i).
    bool has_malformed_word = false;
};

// Words must be non-empty valid UTF-8 and width in [1, max_line_width],
// otherwise the matching JustifyError is returned and nothing is laid out.
JustifyResult justify_text(const std::vector<std::string> &words,
                           int64_t width,
                           BreakStrategy strategy = BreakStrategy::Optimal);
