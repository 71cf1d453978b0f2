/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "matching.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace enertrade
{
namespace
{

constexpr double EPS = 1e-9;

class MatchingTests : public testing::Test
{

protected:

  MatchingEngine engine;

  std::vector<proto::ScorableOffer> offers;
  std::map<std::string, proto::Provider> providers;
  proto::MatchCriteria criteria;

  MatchingTests ()
    : engine(MatchingConfig ())
  {
    providers["good"] = TestProvider ("good", 0.9);
    providers["okay"] = TestProvider ("okay", 0.5);
    providers["bad"] = TestProvider ("bad", 0.1);

    criteria.set_requested_quantity (5);
  }

  /**
   * Adds an offer with the given data to the input list and returns its
   * index in there.
   */
  size_t
  AddOffer (const std::string& id, const std::string& provider,
            const double price, const int64_t available = 10)
  {
    proto::ScorableOffer o;
    *o.mutable_offer () = TestOffer (id, "item " + provider, provider,
                                     price, 10);
    o.set_source_type (proto::CatalogItem::SOLAR);
    o.set_available_blocks (available);
    offers.push_back (o);

    return offers.size () - 1;
  }

  /**
   * Finds the scored offer with the given ID in a result.
   */
  static const proto::ScoredOffer&
  Find (const proto::MatchResult& res, const std::string& id)
  {
    for (const auto& o : res.offers ())
      if (o.offer ().id () == id)
        return o;

    LOG (FATAL) << "Offer not in result: " << id;
    return res.offers (0);
  }

};

TEST_F (MatchingTests, WeightedScore)
{
  AddOffer ("cheap", "good", 5);
  AddOffer ("pricey", "okay", 7);

  const auto res = engine.Match (offers, providers, criteria);
  ASSERT_EQ (res.offers_size (), 2);
  EXPECT_EQ (res.eligible_count (), 2);
  EXPECT_EQ (res.selected_offer_id (), "cheap");

  const auto& cheap = Find (res, "cheap");
  EXPECT_NEAR (cheap.breakdown ().price_score (), 1.0, EPS);
  EXPECT_NEAR (cheap.breakdown ().trust_score (), 0.9, EPS);
  EXPECT_NEAR (cheap.breakdown ().time_fit_score (), 1.0, EPS);
  EXPECT_NEAR (cheap.score (), 0.4 + 0.35 * 0.9 + 0.25, EPS);

  const auto& pricey = Find (res, "pricey");
  EXPECT_NEAR (pricey.breakdown ().price_score (), 0.0, EPS);
  EXPECT_NEAR (pricey.score (), 0.35 * 0.5 + 0.25, EPS);

  EXPECT_EQ (res.offers (0).offer ().id (), "cheap");
}

TEST_F (MatchingTests, SinglePriceGetsFullPriceScore)
{
  AddOffer ("a", "okay", 6);
  AddOffer ("b", "good", 6);

  const auto res = engine.Match (offers, providers, criteria);
  EXPECT_NEAR (Find (res, "a").breakdown ().price_score (), 1.0, EPS);
  EXPECT_NEAR (Find (res, "b").breakdown ().price_score (), 1.0, EPS);

  /* Equal price and time, so trust decides.  */
  EXPECT_EQ (res.selected_offer_id (), "b");
}

TEST_F (MatchingTests, TimeFit)
{
  const size_t indA = AddOffer ("a", "good", 5);
  const size_t indB = AddOffer ("b", "good", 5);
  const auto& a = offers[indA].offer ();
  auto& b = *offers[indB].mutable_offer ();

  auto* w = criteria.mutable_requested_window ();
  w->set_start (a.window ().start ());
  w->set_end (a.window ().end ());

  b.mutable_window ()->set_start (a.window ().start () + 1'800);
  b.mutable_window ()->set_end (a.window ().end () + 1'800);

  const auto res = engine.Match (offers, providers, criteria);
  EXPECT_NEAR (Find (res, "a").breakdown ().time_fit_score (), 1.0, EPS);
  EXPECT_NEAR (Find (res, "b").breakdown ().time_fit_score (), 0.5, EPS);
  EXPECT_EQ (res.selected_offer_id (), "a");
}

TEST_F (MatchingTests, HardFilters)
{
  AddOffer ("fine", "okay", 5);
  AddOffer ("expensive", "good", 20);
  AddOffer ("untrusted", "bad", 4);
  AddOffer ("empty", "good", 4, 0);
  auto& late = *offers[AddOffer ("late", "good", 4)].mutable_offer ();
  late.mutable_window ()->set_start (late.window ().start () + 10 * 3'600);
  late.mutable_window ()->set_end (late.window ().end () + 10 * 3'600);

  criteria.set_max_price (10);
  *criteria.mutable_requested_window () = offers[0].offer ().window ();

  const auto res = engine.Match (offers, providers, criteria);
  ASSERT_EQ (res.offers_size (), 5);
  EXPECT_EQ (res.eligible_count (), 1);
  EXPECT_EQ (res.selected_offer_id (), "fine");
  EXPECT_EQ (res.offers (0).offer ().id (), "fine");

  for (const std::string id : {"expensive", "untrusted", "empty", "late"})
    {
      const auto& o = Find (res, id);
      EXPECT_FALSE (o.matches_filters ()) << id;
      EXPECT_EQ (o.filter_reasons_size (), 1) << id;
      EXPECT_FALSE (o.has_score ()) << id;
    }

  /* Excluded offers are sorted by ID after the eligible one.  */
  EXPECT_EQ (res.offers (1).offer ().id (), "empty");
  EXPECT_EQ (res.offers (2).offer ().id (), "expensive");
  EXPECT_EQ (res.offers (3).offer ().id (), "late");
  EXPECT_EQ (res.offers (4).offer ().id (), "untrusted");
}

TEST_F (MatchingTests, ExcludedOffersDoNotAffectPriceRange)
{
  AddOffer ("a", "good", 5);
  AddOffer ("b", "good", 7);
  AddOffer ("c", "bad", 1);

  const auto res = engine.Match (offers, providers, criteria);
  EXPECT_NEAR (Find (res, "a").breakdown ().price_score (), 1.0, EPS);
  EXPECT_NEAR (Find (res, "b").breakdown ().price_score (), 0.0, EPS);
}

TEST_F (MatchingTests, UnknownProviderUsesDefaultTrust)
{
  AddOffer ("a", "stranger", 5);

  const auto res = engine.Match (offers, providers, criteria);
  ASSERT_EQ (res.eligible_count (), 1);
  EXPECT_NEAR (res.offers (0).provider_trust (), 0.5, EPS);
}

TEST_F (MatchingTests, NothingEligible)
{
  AddOffer ("a", "bad", 5);

  const auto res = engine.Match (offers, providers, criteria);
  EXPECT_EQ (res.offers_size (), 1);
  EXPECT_EQ (res.eligible_count (), 0);
  EXPECT_FALSE (res.has_selected_offer_id ());
}

TEST_F (MatchingTests, CustomWeights)
{
  MatchingConfig cfg;
  cfg.priceWeight = 0;
  cfg.trustWeight = 1;
  cfg.timeWeight = 0;
  MatchingEngine trustOnly(cfg);

  AddOffer ("cheap", "okay", 5);
  AddOffer ("trusted", "good", 7);

  const auto res = trustOnly.Match (offers, providers, criteria);
  EXPECT_EQ (res.selected_offer_id (), "trusted");
  EXPECT_NEAR (res.offers (0).score (), 0.9, EPS);
}

} // anonymous namespace
} // namespace enertrade
