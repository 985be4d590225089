#include "retriever.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace morgue::engine {

    namespace {
        bool is_missing_title(const std::string& title) {
            return is_blank(title) || title == "nan" || title == "None";
        }
    }

    Retriever::Retriever(const VectorIndex& index, const MetadataStore& store, Embedder& embedder,
                         const TextResolver& resolver, const Config& config)
        : m_index(index), m_store(store), m_embedder(embedder), m_resolver(resolver), m_config(config) {}

    QueryResponse Retriever::retrieve(const std::string& query, size_t top_k) const {
        QueryResponse response;
        if (is_blank(query)) {
            response.answer = kEmptyQueryAnswer;
            return response;
        }

        auto vec = m_embedder.embed(query);
        if (vec.empty()) {
            throw RetrievalError("embedding backend returned no vector");
        }
        if (vec.size() != m_index.dimension()) {
            throw RetrievalError("query embedding has dimension " + std::to_string(vec.size()) +
                                 ", index expects " + std::to_string(m_index.dimension()));
        }
        normalize_l2(vec.data(), 1, vec.size());

        size_t k = std::clamp<size_t>(top_k, 1, std::max<size_t>(1, m_config.max_top_k));
        auto hits = m_index.search(vec.data(), k);

        for (const auto& hit : hits) {
            auto record = m_store.get(hit.id);
            if (!record) {
                std::cerr << "[Retriever] No metadata for id " << hit.id << ", dropping hit\n";
                continue;
            }
            auto text = m_resolver.resolve(*record);
            response.sources.push_back(format_passage(*record, text.value_or(""), hit.similarity));
        }

        response.answer = response.sources.empty() ? kNoResultsAnswer : extractive_summary(response.sources);
        return response;
    }

    Passage Retriever::format_passage(const ChunkRecord& record, const std::string& text, float similarity) const {
        Passage p;
        p.id = record.global_id;
        p.title = is_missing_title(record.article_title) ? "Untitled Article" : record.article_title;

        p.date = record.date;
        auto t = p.date.find('T');
        if (t != std::string::npos) p.date.resize(t);

        p.paper = record.paper;
        p.article_id = record.article_id;
        if (!p.article_id.empty()) p.link = m_config.source_link_base + p.article_id;

        p.text = text;
        if (text.size() > m_config.snippet_length) {
            p.snippet = truncate_utf8(text, m_config.snippet_length) + "...";
        } else {
            p.snippet = text;
        }
        p.relevance = relevance_percent(similarity);
        return p;
    }

    std::string Retriever::extractive_summary(const std::vector<Passage>& passages) const {
        if (passages.empty()) return kNoResultsAnswer;

        std::set<std::string> papers;
        std::set<std::string> dates;
        for (const auto& p : passages) {
            if (!p.paper.empty()) papers.insert(p.paper);
            if (!p.date.empty()) dates.insert(p.date);
        }

        std::ostringstream out;
        size_t n = passages.size();
        out << "Found " << n << " relevant article" << (n > 1 ? "s" : "") << " from the "
            << m_config.archive_name << " archive.";

        if (!papers.empty()) {
            out << " Sources include: ";
            size_t shown = 0;
            for (const auto& paper : papers) {
                if (shown == 3) break;
                if (shown > 0) out << ", ";
                out << paper;
                ++shown;
            }
            if (papers.size() > 3) out << " and " << (papers.size() - 3) << " more";
            out << ".";
        }

        if (dates.size() > 1) {
            out << " Date range: " << *dates.begin() << " to " << *dates.rbegin() << ".";
        }

        out << " See the sources below for detailed excerpts.";
        return out.str();
    }

}
