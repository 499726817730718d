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

#include <justifier.hpp>
#include <utils.hpp>
#include <glib.h>
#include <cassert>

const char *error_text(JustifyError e) {
    switch(e) {
    case JustifyError::InvalidWidth:
        return "line width must be at least 1";
    case JustifyError::WidthTooLarge:
        return "line width is larger than the supported maximum";
    case JustifyError::MalformedWord:
        return "words must be non-empty valid UTF-8";
    }
    return "unknown error";
}

Justifier::Justifier(const std::vector<std::string> &words_, int64_t target_width)
    : words{words_}, line_width(target_width) {
    precompute();
}

void Justifier::precompute() {
    lengths.clear();
    lengths.reserve(words.size());
    length_prefix.clear();
    length_prefix.reserve(words.size() + 1);
    length_prefix.push_back(0);
    has_malformed_word = false;
    for(const auto &w : words) {
        if(w.empty() || !g_utf8_validate(w.data(), gssize(w.size()), nullptr)) {
            has_malformed_word = true;
        }
        lengths.push_back(int64_t(utf8_length(w)));
        length_prefix.push_back(length_prefix.back() + lengths.back());
    }
}

std::optional<JustifyError> Justifier::check_input() const {
    if(line_width < 1) {
        return JustifyError::InvalidWidth;
    }
    if(line_width > max_line_width) {
        return JustifyError::WidthTooLarge;
    }
    if(has_malformed_word) {
        return JustifyError::MalformedWord;
    }
    return {};
}

int64_t Justifier::raw_length(size_t begin, size_t end) const {
    assert(begin < end);
    assert(end <= words.size());
    return length_prefix[end] - length_prefix[begin] + int64_t(end - begin - 1);
}

std::optional<int64_t> Justifier::line_badness(size_t begin, size_t end) const {
    if(check_input()) {
        return {};
    }
    if(end - begin == 1 && lengths[begin] > line_width) {
        return 0;
    }
    const int64_t slack = line_width - raw_length(begin, end);
    if(slack < 0) {
        return {};
    }
    if(end == words.size()) {
        return 0;
    }
    return slack * slack;
}

LineSpan Justifier::make_span(size_t begin, size_t end) const {
    const auto badness = line_badness(begin, end);
    assert(badness);
    return LineSpan{begin, end, *badness};
}

PartitionResult Justifier::partition(BreakStrategy strategy) const {
    switch(strategy) {
    case BreakStrategy::Optimal:
        return optimal_partition();
    case BreakStrategy::Greedy:
        return greedy_partition();
    }
    return optimal_partition();
}

PartitionResult Justifier::optimal_partition() const {
    if(const auto e = check_input()) {
        return *e;
    }
    const size_t n = words.size();
    // cost[k] is the smallest total badness for words [k, n),
    // next_break[k] the end of the first line achieving it.
    std::vector<int64_t> cost(n + 1, 0);
    std::vector<size_t> next_break(n, n);
    for(size_t k = n; k-- > 0;) {
        std::optional<int64_t> best;
        for(size_t j = k + 1; j <= n; ++j) {
            const auto badness = line_badness(k, j);
            if(!badness) {
                // Adding words only makes the line longer.
                break;
            }
            const int64_t candidate = *badness + cost[j];
            // On ties the later break wins so earlier lines get more words.
            if(!best || candidate <= *best) {
                best = candidate;
                next_break[k] = j;
            }
        }
        // A single word is always accepted.
        assert(best);
        cost[k] = *best;
    }

    Partition result;
    for(size_t k = 0; k < n; k = next_break[k]) {
        result.lines.push_back(make_span(k, next_break[k]));
    }
    result.total_badness = cost[0];
    return result;
}

PartitionResult Justifier::greedy_partition() const {
    if(const auto e = check_input()) {
        return *e;
    }
    const size_t n = words.size();
    Partition result;
    size_t begin = 0;
    while(begin < n) {
        size_t end = begin + 1;
        while(end < n && raw_length(begin, end + 1) <= line_width) {
            ++end;
        }
        result.lines.push_back(make_span(begin, end));
        result.total_badness += result.lines.back().badness;
        begin = end;
    }
    return result;
}

std::string Justifier::build_line(const LineSpan &span) const {
    assert(span.num_words() > 0);
    std::string line = words[span.begin];
    for(size_t i = span.begin + 1; i < span.end; ++i) {
        line += ' ';
        line += words[i];
    }
    return line;
}

std::string Justifier::build_padded_line(const LineSpan &span) const {
    const int64_t extra = line_width - raw_length(span.begin, span.end);
    if(span.end == words.size() || extra <= 0) {
        return build_line(span);
    }
    std::string line = words[span.begin];
    if(span.num_words() == 1) {
        line.append(size_t(extra), ' ');
        return line;
    }
    const int64_t gaps = int64_t(span.num_words() - 1);
    const int64_t spaces_per_gap = extra / gaps;
    int64_t leftover = extra % gaps;
    for(size_t i = span.begin + 1; i < span.end; ++i) {
        int64_t spaces = 1 + spaces_per_gap;
        if(leftover > 0) {
            ++spaces;
            --leftover;
        }
        line.append(size_t(spaces), ' ');
        line += words[i];
    }
    return line;
}

std::vector<std::string> Justifier::build_lines(const Partition &p) const {
    std::vector<std::string> lines;
    lines.reserve(p.lines.size());
    for(const auto &span : p.lines) {
        lines.emplace_back(build_line(span));
    }
    return lines;
}

std::vector<std::string> Justifier::build_padded_lines(const Partition &p) const {
    std::vector<std::string> lines;
    lines.reserve(p.lines.size());
    for(const auto &span : p.lines) {
        lines.emplace_back(build_padded_line(span));
    }
    return lines;
}

JustifyResult
justify_text(const std::vector<std::string> &words, int64_t width, BreakStrategy strategy) {
    Justifier justifier(words, width);
    const auto result = justifier.partition(strategy);
    if(const auto *e = std::get_if<JustifyError>(&result)) {
        return *e;
    }
    return justifier.build_lines(std::get<Partition>(result));
}
