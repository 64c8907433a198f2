#include "localmind_core/rag/rag_orchestrator.hpp"

#include <algorithm>
#include <iostream>

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

std::string to_string(TurnState state) {
  switch (state) {
    case TurnState::Received: return "RECEIVED";
    case TurnState::Planning: return "PLANNING";
    case TurnState::Retrieving: return "RETRIEVING";
    case TurnState::ToolDispatch: return "TOOL_DISPATCH";
    case TurnState::Grounding: return "GROUNDING";
    case TurnState::Generating: return "GENERATING";
    case TurnState::Completed: return "COMPLETED";
    case TurnState::Failed: return "FAILED";
  }
  return "FAILED";
}

nlohmann::json TurnOutcome::to_json() const {
  nlohmann::json provenance_json = nlohmann::json::array();
  for (const auto& p : provenance) {
    provenance_json.push_back({{"chunk_id", p.chunk_id},
                               {"document_id", p.document_id},
                               {"chunk_index", p.chunk_index},
                               {"start_offset", p.start_offset},
                               {"end_offset", p.end_offset},
                               {"score", p.score}});
  }
  nlohmann::json calls = nlohmann::json::array();
  for (const auto& call : tool_calls) {
    calls.push_back(localmind_core::to_json(call));
  }
  nlohmann::json trace = nlohmann::json::array();
  for (TurnState s : transitions) {
    trace.push_back(to_string(s));
  }

  nlohmann::json out = {{"state", to_string(state)},
                        {"answer", answer},
                        {"provenance", provenance_json},
                        {"tool_calls", calls},
                        {"transitions", trace},
                        {"category", category},
                        {"keywords", keywords}};
  if (turn_id > 0) {
    out["turn_id"] = turn_id;
  }
  if (error_kind) {
    out["error"] = {{"kind", to_string(*error_kind)}, {"message", error_message}};
    out["partial_context"] = partial_context;
  }
  if (style) {
    out["style"] = style->to_json();
  }
  return out;
}

RagOrchestrator::RagOrchestrator(OrchestratorComponents components, OrchestratorOptions options)
    : components_(std::move(components)), options_(std::move(options)) {}

void RagOrchestrator::transition(TurnOutcome& outcome, TurnState next, const CancellationToken& token) const {
  token.throw_if_cancelled(to_string(outcome.state) + " -> " + to_string(next));
  outcome.state = next;
  outcome.transitions.push_back(next);
}

void RagOrchestrator::dispatch(std::vector<ToolCallRequest>& pending,
                               TurnOutcome& outcome,
                               const TurnRequest& request) const {
  ToolContext context{request.conversation_id, request.cancellation};
  for (const auto& call : pending) {
    request.cancellation.throw_if_cancelled("tool dispatch");
    ToolCallRecord record = components_.tools->invoke(call, context);
    outcome.tool_calls.push_back(record);
    if (!record.success && record.required) {
      ErrorKind kind = error_kind_from_string(record.error_kind);
      if (kind == ErrorKind::Internal) {
        kind = ErrorKind::ToolFailure;
      }
      throw LocalMindError(kind, "Required tool " + record.name + " failed: " + record.error);
    }
  }
  pending.clear();
}

TurnOutcome RagOrchestrator::run(const TurnRequest& request) const {
  TurnOutcome outcome;
  outcome.transitions.push_back(TurnState::Received);

  GroundingContext grounding;
  std::string last_reply;
  size_t iterations = 0;

  try {
    if (text::is_blank(request.query)) {
      throw InvalidArgumentError("Query must not be empty");
    }

    transition(outcome, TurnState::Planning, request.cancellation);
    QueryPlan plan =
        components_.planner->plan(request.query, request.tool_requests, request.conversation_id);

    if (plan.retrieve && request.retrieve) {
      transition(outcome, TurnState::Retrieving, request.cancellation);
      RetrievalRequest retrieval;
      retrieval.query = plan.search_query;
      retrieval.top_k = request.top_k;
      retrieval.categories = request.categories;
      retrieval.category_scoped = request.category_scoped;
      retrieval.min_score = request.min_score;
      grounding.chunks = components_.retriever->retrieve(retrieval).chunks;
    }

    if (!request.conversation_id.empty() && options_.history_turns > 0) {
      grounding.history = components_.conversations->get_recent(request.conversation_id, options_.history_turns);
    }

    GenerationConstraints constraints = options_.generation;
    if (constraints.system_prompt.empty()) {
      constraints.system_prompt = components_.prompt_builder->system_prompt(*components_.tools);
    }

    std::vector<ToolCallRequest> pending = std::move(plan.tool_calls);
    while (true) {
      if (!pending.empty()) {
        transition(outcome, TurnState::ToolDispatch, request.cancellation);
        dispatch(pending, outcome, request);
      }

      transition(outcome, TurnState::Grounding, request.cancellation);
      grounding.tool_results = outcome.tool_calls;
      BuiltPrompt built = components_.prompt_builder->build(request.query, grounding);

      outcome.provenance.clear();
      for (const auto& scored : grounding.chunks) {
        if (std::find(built.included_chunk_ids.begin(), built.included_chunk_ids.end(), scored.chunk.id) ==
            built.included_chunk_ids.end()) {
          continue;
        }
        outcome.provenance.push_back({scored.chunk.id, scored.chunk.document_id, scored.chunk.chunk_index,
                                      scored.chunk.start_offset, scored.chunk.end_offset, scored.score});
      }

      if (request.style_mode && !outcome.style) {
        std::string exemplar = request.style_exemplar;
        if (text::is_blank(exemplar)) {
          for (const auto& scored : grounding.chunks) {
            exemplar += scored.chunk.content + "\n";
          }
        }
        if (!text::is_blank(exemplar)) {
          outcome.style = components_.style_analyzer->analyze(exemplar);
          constraints.style_guide = outcome.style->to_constraints();
        }
      }

      transition(outcome, TurnState::Generating, request.cancellation);
      GenerationResult result = components_.generator->generate(built.prompt, constraints);
      last_reply = result.text;

      if (!result.tool_call) {
        outcome.answer = result.text;
        break;
      }
      if (iterations >= options_.max_tool_iterations) {
        throw ToolLoopExceededError("Model requested more than " + std::to_string(options_.max_tool_iterations) +
                                    " rounds of tool calls");
      }
      ++iterations;
      pending.push_back(*result.tool_call);
    }

    const std::string turn_text = request.query + "\n" + outcome.answer;
    outcome.category = components_.classifier->primary_category(turn_text);
    outcome.keywords = components_.keyword_extractor->extract(turn_text);

    if (request.persist && !request.conversation_id.empty()) {
      request.cancellation.throw_if_cancelled("persist");
      ConversationTurn turn;
      turn.conversation_id = request.conversation_id;
      turn.user_query = request.query;
      turn.response = outcome.answer;
      turn.created_at = std::chrono::system_clock::now();
      for (const auto& p : outcome.provenance) {
        turn.retrieved_chunk_ids.push_back(p.chunk_id);
      }
      turn.tool_calls = outcome.tool_calls;
      turn.category = outcome.category;
      turn.keywords = outcome.keywords;
      outcome.turn_id = components_.conversations->append_turn(turn);

      // A stored turn is complete; a cancel arriving during the write is ignored.
      outcome.state = TurnState::Completed;
      outcome.transitions.push_back(TurnState::Completed);
      return outcome;
    }

    transition(outcome, TurnState::Completed, request.cancellation);
    return outcome;

  } catch (const LocalMindError& e) {
    outcome.error_kind = e.kind();
    outcome.error_message = e.what();
  } catch (const std::exception& e) {
    outcome.error_kind = ErrorKind::Internal;
    outcome.error_message = e.what();
  }

  std::cerr << "[RagOrchestrator] Turn failed in " << to_string(outcome.state) << " ("
            << to_string(*outcome.error_kind) << "): " << outcome.error_message << std::endl;

  nlohmann::json retrieved = nlohmann::json::array();
  for (const auto& scored : grounding.chunks) {
    retrieved.push_back({{"chunk_id", scored.chunk.id}, {"score", scored.score}});
  }
  outcome.partial_context = {{"failed_in", to_string(outcome.state)},
                             {"retrieved", retrieved},
                             {"tool_iterations", iterations},
                             {"last_reply", last_reply}};
  outcome.state = TurnState::Failed;
  outcome.transitions.push_back(TurnState::Failed);
  return outcome;
}

}  // namespace localmind_core
