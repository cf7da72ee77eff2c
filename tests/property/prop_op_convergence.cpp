#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "support/peer_pair.hpp"

#include <algorithm>
#include <map>
#include <tuple>

using namespace tandem;
using namespace tandem::sync;
using namespace tandem::test;

namespace {

enum class OpKind { Create, CreateWithPayload, Rename, Retag, Delete, Reorder, ReplacePayload };

struct RandomOp {
    OpKind kind = OpKind::Create;
    size_t target = 0;
    std::string text;
    uint16_t payload_size = 0;
};

struct Snapshot {
    std::map<std::string, std::tuple<std::string, std::vector<std::string>, int, double>> items;
    std::map<std::string, Bytes> payloads;

    bool operator==(const Snapshot&) const = default;
};

Snapshot snapshotOf(storage::ProjectStore& store) {
    Snapshot snapshot;
    for (const auto& item : store.load_items().unwrap()) {
        snapshot.items[item.id] = {item.label, item.tags, item.order, item.duration};
        auto payload = store.load_payload(item.id).unwrap();
        if (payload) snapshot.payloads[item.id] = *payload;
    }
    return snapshot;
}

} // namespace

namespace rc {

template<>
struct Arbitrary<RandomOp> {
    static Gen<RandomOp> arbitrary() {
        return gen::build<RandomOp>(
            gen::set(&RandomOp::kind, gen::element(OpKind::Create, OpKind::CreateWithPayload,
                                                   OpKind::Rename, OpKind::Retag, OpKind::Delete,
                                                   OpKind::Reorder, OpKind::ReplacePayload)),
            gen::set(&RandomOp::target, gen::inRange<size_t>(0, 16)),
            gen::set(&RandomOp::text, gen::container<std::string>(gen::inRange<char>(' ', '~'))),
            gen::set(&RandomOp::payload_size, gen::inRange<uint16_t>(1, 5000)));
    }
};

} // namespace rc

TEST_CASE("Property: the viewer converges on the editor's state", "[property][sync]") {
    REQUIRE(rc::check("any sequence of editor mutations is replicated exactly",
        [](const std::vector<RandomOp>& ops) {
            SyncPair pair;
            RC_ASSERT(pair.connect());
            RC_ASSERT(pair.syncAndCommit());

            auto& editor = *pair.editor.orchestrator;
            std::vector<std::string> ids;
            uint8_t fill = 0;

            for (const auto& op : ops) {
                const std::string target = ids.empty() ? std::string{} : ids[op.target % ids.size()];
                switch (op.kind) {
                    case OpKind::Create:
                    case OpKind::CreateWithPayload: {
                        std::optional<Bytes> payload;
                        if (op.kind == OpKind::CreateWithPayload) {
                            payload = Bytes(op.payload_size, ++fill);
                        }
                        auto created = editor.createItem(
                            create_item(op.text, static_cast<int>(ids.size())), payload);
                        RC_ASSERT(created.is_ok());
                        ids.push_back(created.unwrap().id);
                        break;
                    }
                    case OpKind::Rename:
                        if (target.empty()) break;
                        RC_ASSERT(editor.updateItem(target, ItemChanges{.label = op.text}).is_ok());
                        break;
                    case OpKind::Retag:
                        if (target.empty()) break;
                        RC_ASSERT(editor.updateItem(target, ItemChanges{
                            .tags = std::vector<std::string>{op.text, "x"}}).is_ok());
                        break;
                    case OpKind::Delete:
                        if (target.empty()) break;
                        RC_ASSERT(editor.deleteItem(target).is_ok());
                        ids.erase(std::find(ids.begin(), ids.end(), target));
                        break;
                    case OpKind::Reorder: {
                        std::vector<ItemOrder> order;
                        for (size_t i = 0; i < ids.size(); ++i) {
                            order.push_back(ItemOrder{
                                .id = ids[i],
                                .order = static_cast<int>((i + op.target) % ids.size())});
                        }
                        RC_ASSERT(editor.reorderItems(order).is_ok());
                        break;
                    }
                    case OpKind::ReplacePayload:
                        if (target.empty()) break;
                        RC_ASSERT(editor.replaceItemPayload(
                            target, PayloadMetadata{.duration = op.payload_size / 100.0},
                            Bytes(op.payload_size, ++fill)).is_ok());
                        break;
                }
            }

            const bool settled = spinUntil([&] {
                return editor.outboundBacklog() == 0 &&
                       snapshotOf(*pair.editor.store) == snapshotOf(*pair.viewer.store);
            }, std::chrono::milliseconds(5000));
            RC_ASSERT(settled);
        }
    ));
}
