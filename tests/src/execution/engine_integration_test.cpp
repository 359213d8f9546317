#include <gtest/gtest.h>
#include <guild/testing/execution_fixture.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using guild::schema::amount_t;
using guild::schema::event_type_t;
using guild::schema::governance_error_code;
using guild::testing::execution_fixture;
using guild::testing::kOneDay;
using guild::testing::kWeek;
using guild::testing::make_handle;
using guild::testing::make_hash;
using guild::testing::make_url;

const auto kCarol = make_hash(0x30);
const auto kDave = make_hash(0x40);
const auto kWallet = make_hash(0x50);
const auto kDonor = make_hash(0x60);

guild::schema::proposal_id_t submit(execution_fixture& fixture,
                                    const guild::schema::principal_t& caller,
                                    const amount_t& value) {
  auto result = fixture.engine().submit_proposal(
      caller, make_url("https://guild.example/p"), make_hash(0x70), kWallet,
      value);
  EXPECT_TRUE(result.ok()) << result.log << " " << result.info;
  return guild::schema::make_hash32(result.data);
}

}  // namespace

TEST(engine_integration, genesis_members_are_full_at_start) {
  auto fixture = execution_fixture{"guild_engine_genesis"};
  auto& engine = fixture.engine();
  EXPECT_TRUE(engine.is_member(execution_fixture::alice()));
  EXPECT_TRUE(engine.is_member(execution_fixture::bob()));
  EXPECT_TRUE(engine.is_handle_taken(make_handle("alice")));

  auto info = engine.info();
  EXPECT_EQ(info.member_count, 2u);
  EXPECT_EQ(info.last_sequence, 2u);
  EXPECT_FALSE(guild::schema::is_zero(info.state_root));

  auto events = engine.events(1, 10);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, event_type_t::new_member);
  EXPECT_EQ(events[0].sequence, 1u);
  EXPECT_EQ(events[1].sequence, 2u);
}

TEST(engine_integration, sponsor_is_rate_limited_for_one_week) {
  auto fixture = execution_fixture{"guild_engine_rate_limit"};
  auto& engine = fixture.engine();
  const auto t = fixture.clock().now();

  ASSERT_TRUE(engine.sponsor_member(execution_fixture::alice(), kCarol,
                                    make_handle("carol"))
                  .ok());
  ASSERT_TRUE(engine.donate(kDonor, 1000).ok());

  fixture.clock().set(t + kWeek - 1);
  EXPECT_TRUE(has_error(engine.sponsor_member(execution_fixture::alice(),
                                              kDave, make_handle("dave")),
                        governance_error_code::rate_limited));
  EXPECT_TRUE(has_error(
      engine.submit_proposal(execution_fixture::alice(), make_url("u"),
                             make_hash(1), kWallet, 1),
      governance_error_code::rate_limited));

  fixture.clock().set(t + kWeek);
  EXPECT_TRUE(engine.sponsor_member(execution_fixture::alice(), kDave,
                                    make_handle("dave"))
                  .ok());
}

TEST(engine_integration, member_veto_window_is_half_open) {
  auto fixture = execution_fixture{"guild_engine_member_veto"};
  auto& engine = fixture.engine();
  const auto t1 = fixture.clock().now();
  ASSERT_TRUE(engine.sponsor_member(execution_fixture::alice(), kCarol,
                                    make_handle("carol"))
                  .ok());
  ASSERT_TRUE(engine.sponsor_member(execution_fixture::bob(), kDave,
                                    make_handle("dave"))
                  .ok());

  fixture.clock().set(t1 + kWeek - 1);
  ASSERT_TRUE(engine.veto_member(execution_fixture::bob(), kDave).ok());
  EXPECT_FALSE(engine.is_member(kDave));
  EXPECT_FALSE(engine.get_member(kDave).has_value());
  EXPECT_TRUE(engine.is_handle_taken(make_handle("dave")));

  fixture.clock().set(t1 + kWeek);
  EXPECT_TRUE(has_error(engine.veto_member(execution_fixture::bob(), kCarol),
                        governance_error_code::veto_window_closed));
  EXPECT_TRUE(engine.is_member(kCarol));
}

TEST(engine_integration, failed_actions_do_not_consume_cooldown) {
  auto fixture = execution_fixture{"guild_engine_cooldown"};
  auto& engine = fixture.engine();
  EXPECT_TRUE(has_error(engine.sponsor_member(execution_fixture::alice(),
                                              execution_fixture::bob(),
                                              make_handle("other")),
                        governance_error_code::already_member));
  EXPECT_TRUE(has_error(engine.submit_proposal(execution_fixture::alice(),
                                               make_url("u"), make_hash(1),
                                               kWallet, 1),
                        governance_error_code::insufficient_funds));
  EXPECT_EQ(engine.get_member(execution_fixture::alice())->last_action_time,
            0u);
  EXPECT_TRUE(engine.sponsor_member(execution_fixture::alice(), kCarol,
                                    make_handle("carol"))
                  .ok());
}

TEST(engine_integration, proposal_is_claimed_exactly_once) {
  auto fixture = execution_fixture{"guild_engine_claim"};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.donate(kDonor, 101).ok());
  EXPECT_TRUE(has_error(
      engine.submit_proposal(execution_fixture::alice(), make_url("u"),
                             make_hash(1), kWallet, 101),
      governance_error_code::insufficient_funds));
  const auto id = submit(fixture, execution_fixture::alice(), 100);

  auto transfers = std::vector<amount_t>{};
  engine.set_transfer_handler(
      [&](const guild::schema::proposal_state_t& proposal) {
        transfers.push_back(proposal.value);
        return true;
      });

  fixture.clock().advance(kWeek - 1);
  EXPECT_TRUE(has_error(engine.claim_proposal(kDonor, id),
                        governance_error_code::not_yet_claimable));

  fixture.clock().advance(1);
  ASSERT_TRUE(engine.claim_proposal(kDonor, id).ok());
  ASSERT_TRUE(engine.claim_proposal(kDonor, id).ok());
  EXPECT_EQ(engine.treasury_balance(), amount_t{1});
  ASSERT_EQ(transfers.size(), 1u);
  EXPECT_EQ(transfers[0], amount_t{100});
  EXPECT_EQ(engine.get_proposal(id)->value, amount_t{0});
}

TEST(engine_integration, vetoed_proposal_claim_is_a_no_op) {
  auto fixture = execution_fixture{"guild_engine_veto_claim"};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.donate(kDonor, 500).ok());
  const auto t = fixture.clock().now();
  const auto id = submit(fixture, execution_fixture::alice(), 200);

  fixture.clock().set(t + 3 * kOneDay);
  ASSERT_TRUE(engine.veto_proposal(execution_fixture::bob(), id).ok());

  auto transfers = 0;
  engine.set_transfer_handler([&](const auto&) {
    ++transfers;
    return true;
  });
  fixture.clock().set(t + 8 * kOneDay);
  const auto before = engine.info().last_sequence;
  auto claimed = engine.claim_proposal(kDonor, id);
  EXPECT_TRUE(claimed.ok());
  EXPECT_TRUE(claimed.events.empty());
  EXPECT_EQ(transfers, 0);
  EXPECT_EQ(engine.treasury_balance(), amount_t{500});
  EXPECT_EQ(engine.info().last_sequence, before);
}

TEST(engine_integration, duplicate_submission_depends_on_tick) {
  auto options = execution_fixture::default_options();
  options.cooldown = 0;
  auto fixture = execution_fixture{"guild_engine_duplicate", options};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.donate(kDonor, 1000).ok());

  const auto first = submit(fixture, execution_fixture::alice(), 10);
  EXPECT_TRUE(has_error(
      engine.submit_proposal(execution_fixture::alice(),
                             make_url("https://guild.example/p"),
                             make_hash(0x70), kWallet, 10),
      governance_error_code::duplicate_proposal));

  fixture.clock().advance(1);
  const auto second = submit(fixture, execution_fixture::alice(), 10);
  EXPECT_NE(first, second);
  EXPECT_EQ(engine.info().proposal_count, 2u);
}

TEST(engine_integration, strict_mode_rejects_unknown_proposal_veto) {
  auto compatible = execution_fixture{"guild_engine_veto_compat"};
  auto result =
      compatible.engine().veto_proposal(execution_fixture::bob(), make_hash(9));
  EXPECT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, event_type_t::proposal_vetoed);

  auto options = execution_fixture::default_options();
  options.strict_proposal_veto = true;
  auto strict = execution_fixture{"guild_engine_veto_strict", options};
  EXPECT_TRUE(has_error(
      strict.engine().veto_proposal(execution_fixture::bob(), make_hash(9)),
      governance_error_code::proposal_not_found));
}

TEST(engine_integration, handle_release_is_configurable) {
  auto options = execution_fixture::default_options();
  options.release_handle_on_member_veto = true;
  auto fixture = execution_fixture{"guild_engine_handle_release", options};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.sponsor_member(execution_fixture::alice(), kCarol,
                                    make_handle("carol"))
                  .ok());
  ASSERT_TRUE(engine.veto_member(execution_fixture::bob(), kCarol).ok());
  EXPECT_FALSE(engine.is_handle_taken(make_handle("carol")));
  EXPECT_TRUE(engine.sponsor_member(execution_fixture::bob(), kDave,
                                    make_handle("carol"))
                  .ok());
}

TEST(engine_integration, event_sink_sees_committed_events_in_order) {
  auto fixture = execution_fixture{"guild_engine_sink"};
  auto& engine = fixture.engine();
  auto seen = std::vector<guild::schema::governance_event_t>{};
  engine.set_event_sink(
      [&](const guild::schema::governance_event_t& event) {
        seen.push_back(event);
      });

  ASSERT_TRUE(engine.donate(kDonor, 5).ok());
  EXPECT_FALSE(engine.veto_member(kDonor, kCarol).ok());
  ASSERT_TRUE(engine.sponsor_member(execution_fixture::alice(), kCarol,
                                    make_handle("carol"))
                  .ok());

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].type, event_type_t::new_donation);
  EXPECT_EQ(seen[0].sequence, 3u);
  EXPECT_EQ(seen[0].time, fixture.clock().now());
  EXPECT_EQ(guild::schema::find_attribute(seen[0], "amount"), "5");
  EXPECT_EQ(seen[1].type, event_type_t::new_member);
  EXPECT_EQ(seen[1].sequence, 4u);

  auto stored = engine.events(3, 4);
  ASSERT_EQ(stored.size(), 2u);
  EXPECT_EQ(stored[0].type, seen[0].type);
  EXPECT_EQ(stored[1].attributes.size(), seen[1].attributes.size());
}

TEST(engine_integration, throwing_event_sink_does_not_undo_commit) {
  auto fixture = execution_fixture{"guild_engine_sink_throw"};
  auto& engine = fixture.engine();
  auto calls = 0;
  engine.set_event_sink([&](const guild::schema::governance_event_t&) {
    ++calls;
    throw std::runtime_error{"sink unavailable"};
  });

  auto donated = engine.donate(kDonor, 9);
  EXPECT_TRUE(donated.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(engine.treasury_balance(), amount_t{9});

  EXPECT_TRUE(engine.donate(kDonor, 1).ok());
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(engine.info().last_sequence, 4u);
}

TEST(engine_integration, concurrent_claims_pay_exactly_once) {
  auto fixture = execution_fixture{"guild_engine_parallel_claim"};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.donate(kDonor, 1000).ok());
  const auto id = submit(fixture, execution_fixture::alice(), 400);
  fixture.clock().advance(kWeek);
  const auto before = engine.treasury_balance();

  auto payouts = std::atomic<int>{0};
  auto claimed_events = std::atomic<int>{0};
  engine.set_transfer_handler([&](const guild::schema::proposal_state_t&) {
    ++payouts;
    return true;
  });
  engine.set_event_sink([&](const guild::schema::governance_event_t& event) {
    if (event.type == event_type_t::proposal_claimed) {
      ++claimed_events;
    }
  });

  constexpr auto kClaimers = std::size_t{8};
  auto results = std::vector<guild::schema::operation_result_t>(kClaimers);
  auto threads = std::vector<std::thread>{};
  for (auto i = std::size_t{0}; i < kClaimers; ++i) {
    threads.emplace_back(
        [&, i] { results[i] = engine.claim_proposal(kDonor, id); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& result : results) {
    EXPECT_TRUE(result.ok()) << result.log;
  }
  EXPECT_EQ(payouts.load(), 1);
  EXPECT_EQ(claimed_events.load(), 1);
  EXPECT_EQ(engine.treasury_balance(), before - amount_t{400});
  EXPECT_EQ(engine.get_proposal(id)->value, amount_t{0});

  auto logged = 0;
  for (const auto& event : engine.events(1, engine.info().last_sequence)) {
    if (event.type == event_type_t::proposal_claimed) {
      ++logged;
    }
  }
  EXPECT_EQ(logged, 1);
}

TEST(engine_integration, concurrent_sponsors_race_for_one_handle) {
  constexpr auto kSponsors = std::size_t{4};
  auto options = execution_fixture::default_options();
  for (auto i = std::size_t{0}; i < kSponsors; ++i) {
    options.genesis_members.push_back(
        {.member = make_hash(static_cast<uint8_t>(0x81 + i)),
         .handle = make_handle("founder" + std::to_string(i))});
  }
  auto fixture = execution_fixture{"guild_engine_parallel_sponsor", options};
  auto& engine = fixture.engine();

  auto results = std::vector<guild::schema::operation_result_t>(kSponsors);
  auto threads = std::vector<std::thread>{};
  for (auto i = std::size_t{0}; i < kSponsors; ++i) {
    threads.emplace_back([&, i] {
      results[i] = engine.sponsor_member(
          make_hash(static_cast<uint8_t>(0x81 + i)),
          make_hash(static_cast<uint8_t>(0xA1 + i)), make_handle("shared"));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto admitted = 0;
  for (auto i = std::size_t{0}; i < kSponsors; ++i) {
    if (results[i].ok()) {
      ++admitted;
      EXPECT_TRUE(engine.is_member(make_hash(static_cast<uint8_t>(0xA1 + i))));
    } else {
      EXPECT_TRUE(has_error(results[i], governance_error_code::handle_taken))
          << results[i].log;
      EXPECT_FALSE(
          engine.is_member(make_hash(static_cast<uint8_t>(0xA1 + i))));
    }
  }
  EXPECT_EQ(admitted, 1);
  EXPECT_TRUE(engine.is_handle_taken(make_handle("shared")));
}

TEST(engine_integration, failed_transfer_keeps_proposal_claimable) {
  auto fixture = execution_fixture{"guild_engine_transfer"};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.donate(kDonor, 50).ok());
  const auto id = submit(fixture, execution_fixture::alice(), 20);
  fixture.clock().advance(kWeek);

  engine.set_transfer_handler([](const auto&) { return false; });
  EXPECT_TRUE(has_error(engine.claim_proposal(kDonor, id),
                        governance_error_code::transfer_failed));
  EXPECT_EQ(engine.treasury_balance(), amount_t{50});

  engine.set_transfer_handler([](const auto&) { return true; });
  EXPECT_TRUE(engine.claim_proposal(kDonor, id).ok());
  EXPECT_EQ(engine.treasury_balance(), amount_t{30});
}

TEST(engine_integration, state_survives_reopen) {
  auto fixture = execution_fixture{"guild_engine_reopen"};
  ASSERT_TRUE(fixture.engine().donate(kDonor, 1000).ok());
  ASSERT_TRUE(fixture.engine()
                  .sponsor_member(execution_fixture::alice(), kCarol,
                                  make_handle("carol"))
                  .ok());
  const auto id = submit(fixture, execution_fixture::bob(), 300);
  ASSERT_TRUE(fixture.engine().veto_member(execution_fixture::bob(), kCarol).ok());
  const auto before = fixture.engine().info();

  fixture.reopen();
  auto& engine = fixture.engine();
  const auto after = engine.info();
  EXPECT_EQ(after.last_sequence, before.last_sequence);
  EXPECT_EQ(after.state_root, before.state_root);
  EXPECT_EQ(after.member_count, 2u);
  EXPECT_EQ(engine.treasury_balance(), amount_t{1000});
  EXPECT_FALSE(engine.is_member(kCarol));
  EXPECT_TRUE(engine.is_handle_taken(make_handle("carol")));
  EXPECT_EQ(engine.get_member(execution_fixture::alice())->last_action_time,
            fixture.clock().now());

  auto proposal = engine.get_proposal(id);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->value, amount_t{300});

  fixture.clock().advance(kWeek);
  EXPECT_TRUE(engine.claim_proposal(kDonor, id).ok());
  EXPECT_EQ(engine.treasury_balance(), amount_t{700});
  EXPECT_EQ(engine.events(1, after.last_sequence + 1).back().type,
            event_type_t::proposal_claimed);
}
