/** \brief Test cases for the BibleReferenceValidator class.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "BibleBoundsCache.h"
#include "BibleReferenceValidator.h"
#include "FakeBibleCollaborators.h"
#include "UnitTest.h"


using namespace Scripture;


namespace {


// Genesis 50 has 26 verses, John 3 has 36 and everything else 25.
class ValidatorFixture {
    CountingVerseStore verse_store_;
    BibleBoundsCache bounds_cache_;
    BibleReferenceValidator validator_;

public:
    ValidatorFixture(): bounds_cache_(verse_store_), validator_(&bounds_cache_) {
        verse_store_.setVerseCount("KJV", 1, 50, 26);
        verse_store_.setVerseCount("KJV", 43, 3, 36);
        bounds_cache_.setVersion("KJV");
    }

    ValidationResult validate(const ParsedReference &reference) const { return validator_.validate(reference, "KJV"); }
    const CountingVerseStore &getVerseStore() const { return verse_store_; }
};


} // unnamed namespace


TEST(valid_references) {
    const ValidatorFixture fixture;
    const BookRecord john(GetTestBook("John"));

    for (const auto &reference : { MakeReference(john), MakeReference(john, 21u), MakeReference(john, 3u, 16u),
                                   MakeReference(john, 3u, 36u), MakeReference(john, 3u, 16u, 17u), MakeReference(john, 3u, 1u, 36u) })
    {
        const ValidationResult result(fixture.validate(reference));
        CHECK_TRUE(result.is_valid_);
        CHECK_EQ(result.error_, "");
        CHECK_FALSE(result.auto_correction_);
    }
}


TEST(chapter_out_of_range) {
    const ValidatorFixture fixture;

    const ValidationResult result(fixture.validate(MakeReference(GetTestBook("Genesis"), 51u, 1u)));
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "Genesis has only 50 chapters");
    CHECK_TRUE(result.auto_correction_);
    if (result.auto_correction_) {
        CHECK_EQ(result.auto_correction_->chapter_, 50u);
        CHECK_EQ(result.auto_correction_->verse_start_, 1u);
        CHECK_TRUE(result.auto_correction_->is_valid_);
        CHECK_FALSE(result.auto_correction_->hasError());
        CHECK_EQ(result.auto_correction_->raw_input_, "Genesis 50:1");
    }

    // The verses are clamped against the corrected chapter.
    const ValidationResult result2(fixture.validate(MakeReference(GetTestBook("Genesis"), 51u, 30u)));
    CHECK_TRUE(result2.auto_correction_);
    if (result2.auto_correction_)
        CHECK_EQ(FormatReference(*result2.auto_correction_), "Genesis 50:26");

    const ValidationResult result3(fixture.validate(MakeReference(GetTestBook("John"), 0u)));
    CHECK_FALSE(result3.is_valid_);
    CHECK_EQ(result3.error_, "John has only 21 chapters");
    CHECK_TRUE(result3.auto_correction_);
    if (result3.auto_correction_)
        CHECK_EQ(result3.auto_correction_->chapter_, 1u);
}


TEST(verse_out_of_range) {
    const ValidatorFixture fixture;

    const ValidationResult result(fixture.validate(MakeReference(GetTestBook("John"), 3u, 37u)));
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "John 3 has only 36 verses");
    CHECK_TRUE(result.auto_correction_);
    if (result.auto_correction_)
        CHECK_EQ(FormatReference(*result.auto_correction_), "John 3:36");
}


TEST(range_out_of_bounds) {
    const ValidatorFixture fixture;
    const BookRecord john(GetTestBook("John"));

    ValidationResult result(fixture.validate(MakeReference(john, 3u, 16u, 40u)));
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "Invalid verse range. John 3 has 36 verses");
    CHECK_TRUE(result.auto_correction_);
    if (result.auto_correction_)
        CHECK_EQ(FormatReference(*result.auto_correction_), "John 3:16-36");

    // A reversed range is corrected to a single verse.
    result = fixture.validate(MakeReference(john, 3u, 17u, 16u));
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "Invalid verse range. John 3 has 36 verses");
    CHECK_TRUE(result.auto_correction_);
    if (result.auto_correction_) {
        CHECK_EQ(result.auto_correction_->verse_start_, 17u);
        CHECK_EQ(result.auto_correction_->verse_end_, 17u);
        CHECK_EQ(FormatReference(*result.auto_correction_), "John 3:17");
    }
}


TEST(chapter_is_checked_first) {
    const ValidatorFixture fixture;

    const ValidationResult result(fixture.validate(MakeReference(GetTestBook("John"), 22u, 99u, 120u)));
    CHECK_EQ(result.error_, "John has only 21 chapters");
    CHECK_TRUE(result.auto_correction_);
    if (result.auto_correction_)
        CHECK_EQ(FormatReference(*result.auto_correction_), "John 21:25");
}


TEST(invalid_references) {
    const ValidatorFixture fixture;

    ParsedReference unparsable_reference;
    unparsable_reference.raw_input_ = "xyzzy 1:1";
    unparsable_reference.book_token_ = "xyzzy";
    unparsable_reference.error_ = "Book \"xyzzy\" not found";
    ValidationResult result(fixture.validate(unparsable_reference));
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "Book \"xyzzy\" not found");
    CHECK_FALSE(result.auto_correction_);

    result = fixture.validate(ParsedReference());
    CHECK_FALSE(result.is_valid_);
    CHECK_EQ(result.error_, "Invalid reference");

    // Already invalid references never cause any fetching.
    CHECK_EQ(fixture.getVerseStore().getFetchCount(), 0u);
}


TEST(auto_corrections_are_valid) {
    const ValidatorFixture fixture;
    const BookRecord genesis(GetTestBook("Genesis")), john(GetTestBook("John")), jude(GetTestBook("Jude"));

    for (const auto &reference : { MakeReference(genesis, 51u, 1u), MakeReference(genesis, 77u, 50u, 60u), MakeReference(john, 3u, 37u),
                                   MakeReference(john, 3u, 20u, 99u), MakeReference(john, 3u, 30u, 2u), MakeReference(jude, 2u),
                                   MakeReference(jude, 1u, 0u), MakeReference(john, 0u, 0u, 0u) })
    {
        const ValidationResult result(fixture.validate(reference));
        CHECK_FALSE(result.is_valid_);
        CHECK_TRUE(result.auto_correction_);
        if (not result.auto_correction_)
            continue;

        const ValidationResult corrected_result(fixture.validate(*result.auto_correction_));
        CHECK_TRUE(corrected_result.is_valid_);
        CHECK_FALSE(corrected_result.auto_correction_);
    }
}


TEST(bounds_are_fetched_once) {
    const ValidatorFixture fixture;
    const BookRecord john(GetTestBook("John"));

    fixture.validate(MakeReference(john, 3u, 16u));
    fixture.validate(MakeReference(john, 4u, 1u));
    fixture.validate(MakeReference(john, 30u));
    CHECK_EQ(fixture.getVerseStore().getFetchCount(), john.chapter_count_);
}


TEST_MAIN(BibleReferenceValidator)
