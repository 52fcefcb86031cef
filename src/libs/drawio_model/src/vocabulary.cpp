#include <drawio_model/vocabulary.hpp>
#include <utility>

namespace drawio_model {

namespace {

const std::unordered_set<std::string> ric_classes = {
    "AccumulationRelation", "Activity", "ActivityDocumentationRelation", "ActivityType", "Agent",
    "AgentControlRelation", "AgentHierarchicalRelation", "AgentName", "AgentTemporalRelation",
    "AgentToAgentRelation", "Appellation", "AppellationRelation", "AuthorityRelation",
    "AuthorshipRelation", "CarrierExtent", "CarrierType", "ChildRelation", "Concept", "ContentType",
    "Coordinates", "CorporateBody", "CorporateBodyType", "CorrespondenceRelation",
    "CreationRelation", "Date", "DateType", "DemographicGroup", "DerivationRelation",
    "DescendanceRelation", "DocumentaryFormType", "Event", "EventRelation", "EventType", "Extent",
    "ExtentType", "Family", "FamilyRelation", "FamilyType", "FunctionalEquivalenceRelation",
    "Group", "GroupSubdivisionRelation", "Identifier", "IdentifierType", "Instantiation",
    "InstantiationExtent", "InstantiationToInstantiationRelation",
    "IntellectualPropertyRightsRelation", "KnowingOfRelation", "KnowingRelation", "Language",
    "LeadershipRelation", "LegalStatus", "ManagementRelation", "Mandate", "MandateRelation",
    "MandateType", "Mechanism", "MembershipRelation", "MigrationRelation", "Name", "OccupationType",
    "OrganicOrFunctionalProvenanceRelation", "OrganicProvenanceRelation", "OwnershipRelation",
    "PerformanceRelation", "Person", "PhysicalLocation", "Place", "PlaceName", "PlaceRelation",
    "PlaceType", "Position", "PositionHoldingRelation", "PositionToGroupRelation",
    "ProductionTechniqueType", "Proxy", "Record", "RecordPart", "RecordResource",
    "RecordResourceExtent", "RecordResourceGeneticRelation", "RecordResourceHoldingRelation",
    "RecordResourceToInstantiationRelation", "RecordResourceToRecordResourceRelation", "RecordSet",
    "RecordSetType", "RecordState", "Relation", "RepresentationType", "RoleType", "Rule",
    "RuleRelation", "RuleType", "SequentialRelation", "SiblingRelation", "SpouseRelation",
    "TeachingRelation", "TemporalRelation", "Thing", "Title", "Type", "TypeRelation",
    "UnitOfMeasurement", "WholePartRelation", "WorkRelation",
};

const std::unordered_set<std::string> ric_object_properties = {
    "affectsOrAffected", "agentHasOrHadLocation", "authorizedBy", "authorizes", "contained",
    "containsOrContained", "containsTransitive", "describesOrDescribed", "directlyContains",
    "directlyFollowsInSequence", "directlyIncludes", "directlyPrecedesInSequence", "documentedBy",
    "documents", "existsOrExistedIn", "expressesOrExpressed", "followedInSequence",
    "followsInSequenceTransitive", "followsInTime", "followsOrFollowed", "hadComponent",
    "hadConstituent", "hadPart", "hadSubdivision", "hadSubevent", "hadSubordinate",
    "hasAccumulator", "hasActivityType", "hasAddressee", "hasAncestor", "hasAuthor",
    "hasBeginningDate", "hasBirthDate", "hasBirthPlace", "hasCarrierType", "hasChild",
    "hasCollector", "hasComponentTransitive", "hasConstituentTransitive", "hasContentOfType",
    "hasCopy", "hasCreationDate", "hasCreator", "hasDateType", "hasDeathDate", "hasDeathPlace",
    "hasDescendant", "hasDestructionDate", "hasDirectComponent", "hasDirectConstituent",
    "hasDirectPart", "hasDirectSubdivision", "hasDirectSubevent", "hasDirectSubordinate",
    "hasDocumentaryFormType", "hasDraft", "hasEndDate", "hasEventType", "hasExtent",
    "hasExtentType", "hasFamilyAssociationWith", "hasFamilyType", "hasGeneticLinkToRecordResource",
    "hasIdentifierType", "hasModificationDate", "hasOrHadAgentName",
    "hasOrHadAllMembersWithCategory", "hasOrHadAllMembersWithContentType",
    "hasOrHadAllMembersWithCreationDate", "hasOrHadAllMembersWithDocumentaryFormType",
    "hasOrHadAllMembersWithLanguage", "hasOrHadAllMembersWithLegalStatus",
    "hasOrHadAllMembersWithRecordState", "hasOrHadAnalogueInstantiation", "hasOrHadAppellation",
    "hasOrHadAuthorityOver", "hasOrHadCategory", "hasOrHadComponent", "hasOrHadConstituent",
    "hasOrHadController", "hasOrHadCoordinates", "hasOrHadCorporateBodyType",
    "hasOrHadCorrespondent", "hasOrHadDemographicGroup", "hasOrHadDerivedInstantiation",
    "hasOrHadDigitalInstantiation", "hasOrHadEmployer", "hasOrHadHolder", "hasOrHadIdentifier",
    "hasOrHadInstantiation", "hasOrHadIntellectualPropertyRightsHolder", "hasOrHadJurisdiction",
    "hasOrHadLanguage", "hasOrHadLeader", "hasOrHadLegalStatus", "hasOrHadLocation",
    "hasOrHadMainSubject", "hasOrHadManager", "hasOrHadMandateType", "hasOrHadMember",
    "hasOrHadMostMembersWithCreationDate", "hasOrHadName", "hasOrHadOccupationOfType",
    "hasOrHadOwner", "hasOrHadPart", "hasOrHadParticipant", "hasOrHadPhysicalLocation",
    "hasOrHadPlaceName", "hasOrHadPlaceType", "hasOrHadPosition", "hasOrHadRuleType",
    "hasOrHadSomeMembersWithCategory", "hasOrHadSomeMembersWithContentType",
    "hasOrHadSomeMembersWithCreationDate", "hasOrHadSomeMembersWithLanguage",
    "hasOrHadSomeMembersWithLegalStatus", "hasOrHadSomeMembersWithRecordState",
    "hasOrHadSomeMemberswithDocumentaryFormType", "hasOrHadSpouse", "hasOrHadStudent",
    "hasOrHadSubdivision", "hasOrHadSubevent", "hasOrHadSubject", "hasOrHadSubordinate",
    "hasOrHadTeacher", "hasOrHadTitle", "hasOrHadWorkRelationWith",
    "hasOrganicOrFunctionalProvenance", "hasOrganicProvenance", "hasOriginal", "hasPartTransitive",
    "hasProductionTechniqueType", "hasPublicationDate", "hasPublisher", "hasReceiver",
    "hasRecordSetType", "hasRecordState", "hasReply", "hasRepresentationType", "hasSender",
    "hasSibling", "hasSubdivisionTransitive", "hasSubeventTransitive", "hasSubordinateTransitive",
    "hasSuccessor", "hasUnitOfMeasurement", "hasWithin", "included", "includesOrIncluded",
    "includesTransitive", "intersects", "isAccumulatorOf", "isActivityTypeOf", "isAddresseeOf",
    "isAgentAssociatedWithAgent", "isAgentAssociatedWithPlace", "isAssociatedWithDate",
    "isAssociatedWithEvent", "isAssociatedWithPlace", "isAssociatedWithRule", "isAuthorOf",
    "isBeginningDateOf", "isBirthDateOf", "isBirthPlaceOf", "isCarrierTypeOf", "isChildOf",
    "isCollectorOf", "isComponentOfTransitive", "isConstituentOfTransitive",
    "isContainedByTransitive", "isContentTypeOf", "isCopyOf", "isCreationDateOf", "isCreatorOf",
    "isDateAssociatedWith", "isDateOfOccurrenceOf", "isDateTypeOf", "isDeathDateOf",
    "isDeathPlaceOf", "isDestructionDateOf", "isDirectComponentOf", "isDirectConstituentOf",
    "isDirectPartOf", "isDirectSubdivisionOf", "isDirectSubeventOf", "isDirectSubordinateTo",
    "isDirectlyContainedBy", "isDirectlyIncludedIn", "isDocumentaryFormTypeOf", "isDraftOf",
    "isEndDateOf", "isEquivalentTo", "isEventAssociatedWith", "isEventTypeOf", "isExtentOf",
    "isExtentTypeOf", "isFamilyTypeOf", "isFromUseDateOf", "isFunctionallyEquivalentTo",
    "isIdentifierTypeOf", "isIncludedInTransitive", "isInstantiationAssociatedWithInstantiation",
    "isLastUpdateDateOf", "isModificationDateOf", "isOrWasAdjacentTo", "isOrWasAffectedBy",
    "isOrWasAgentNameOf", "isOrWasAnalogueInstantiationOf", "isOrWasAppellationOf",
    "isOrWasCategoryOf", "isOrWasCategoryOfAllMembersOf", "isOrWasCategoryOfSomeMembersOf",
    "isOrWasComponentOf", "isOrWasConstituentOf", "isOrWasContainedBy",
    "isOrWasContentTypeOfAllMembersOf", "isOrWasContentTypeOfSomeMembersOf", "isOrWasControllerOf",
    "isOrWasCoordinatesOf", "isOrWasCorporateBodyTypeOf", "isOrWasCreationDateOfAllMembersOf",
    "isOrWasCreationDateOfMostMembersOf", "isOrWasCreationDateOfSomeMembersOf",
    "isOrWasDemographicGroupOf", "isOrWasDerivedFromInstantiation", "isOrWasDescribedBy",
    "isOrWasDigitalInstantiationOf", "isOrWasDocumentaryFormTypeOfAllMembersOf",
    "isOrWasDocumentaryFormTypeOfSomeMembersOf", "isOrWasEmployerOf", "isOrWasEnforcedBy",
    "isOrWasExpressedBy", "isOrWasHolderOf", "isOrWasHolderOfIntellectualPropertyRightsOf",
    "isOrWasIdentifierOf", "isOrWasIncludedIn", "isOrWasInstantiationOf", "isOrWasJurisdictionOf",
    "isOrWasLanguageOf", "isOrWasLanguageOfAllMembersOf", "isOrWasLanguageOfSomeMembersOf",
    "isOrWasLeaderOf", "isOrWasLegalStatusOf", "isOrWasLegalStatusOfAllMembersOf",
    "isOrWasLegalStatusOfSomeMembersOf", "isOrWasLocationOf", "isOrWasLocationOfAgent",
    "isOrWasMainSubjectOf", "isOrWasManagerOf", "isOrWasMandateTypeOf", "isOrWasMemberOf",
    "isOrWasNameOf", "isOrWasOccupationTypeOf", "isOrWasOccupiedBy", "isOrWasOwnerOf",
    "isOrWasPartOf", "isOrWasParticipantIn", "isOrWasPerformedBy", "isOrWasPhysicalLocationOf",
    "isOrWasPlaceNameOf", "isOrWasPlaceTypeOf", "isOrWasRecordStateOfAllMembersOf",
    "isOrWasRecordStateOfSomeMembersOf", "isOrWasRegulatedBy", "isOrWasResponsibleForEnforcing",
    "isOrWasRuleTypeOf", "isOrWasSubdivisionOf", "isOrWasSubeventOf", "isOrWasSubjectOf",
    "isOrWasSubordinateTo", "isOrWasTitleOf", "isOrWasUnderAuthorityOf",
    "isOrganicOrFunctionalProvenanceOf", "isOrganicProvenanceOf", "isOriginalOf",
    "isPartOfTransitive", "isPlaceAssociatedWith", "isPlaceAssociatedWithAgent",
    "isProductionTechniqueTypeOf", "isPublicationDateOf", "isPublisherOf", "isReceiverOf",
    "isRecordResourceAssociatedWithRecordResource", "isRecordSetTypeOf", "isRecordStateOf",
    "isRelatedTo", "isReplyTo", "isRepresentationTypeOf", "isResponsibleForIssuing",
    "isRuleAssociatedWith", "isSenderOf", "isSubdivisionOfTransitive", "isSubeventOfTransitive",
    "isSubordinateToTransitive", "isSuccessorOf", "isToUseDateOf", "isUnitOfMeasurementOf",
    "isWithin", "issuedBy", "knownBy", "knows", "knowsOf", "migratedFrom", "migratedInto",
    "occupiesOrOccupied", "occurredAtDate", "overlapsOrOverlapped", "performsOrPerformed",
    "precededInSequence", "precedesInSequenceTransitive", "precedesInTime", "precedesOrPreceded",
    "proxyFor", "proxyIn", "regulatesOrRegulated", "resultedFromTheMergerOf",
    "resultedFromTheSplitOf", "resultsOrResultedFrom", "resultsOrResultedIn", "wasComponentOf",
    "wasConstituentOf", "wasContainedBy", "wasIncludedIn", "wasLastUpdatedAtDate", "wasMergedInto",
    "wasPartOf", "wasSplitInto", "wasSubdivisionOf", "wasSubeventOf", "wasSubordinateTo",
    "wasUsedFromDate", "wasUsedToDate",
};

const std::unordered_set<std::string> ric_datatype_properties = {
    "accruals", "accrualsStatus", "altimetricSystem", "altitude", "authenticityNote",
    "authorizingMandate", "beginningDate", "birthDate", "carrierExtent", "classification",
    "conditionsOfAccess", "conditionsOfUse", "creationDate", "date", "dateQualifier", "deathDate",
    "destructionDate", "endDate", "expressedDate", "generalDescription", "geodesicSystem",
    "geographicalCoordinates", "height", "history", "identifier", "instantiationExtent",
    "instantiationStructure", "integrityNote", "lastModificationDate", "latitude", "length",
    "location", "longitude", "measure", "modificationDate", "name", "normalizedDateValue",
    "normalizedValue", "physicalCharacteristicsNote", "physicalOrLogicalExtent",
    "productionTechnique", "publicationDate", "qualityOfRepresentationNote", "quantity",
    "recordResourceExtent", "recordResourceStructure", "referenceSystem", "relationCertainty",
    "relationSource", "relationState", "ruleFollowed", "scopeAndContent", "structure",
    "technicalCharacteristics", "textualValue", "title", "type", "unitOfMeasurement",
    "usedFromDate", "usedToDate", "width",
};

} // namespace

bool RicVocabulary::is_class(const std::string& name) const {
    return ric_classes.count(name) > 0;
}

bool RicVocabulary::is_object_property(const std::string& name) const {
    return ric_object_properties.count(name) > 0;
}

bool RicVocabulary::is_datatype_property(const std::string& name) const {
    return ric_datatype_properties.count(name) > 0;
}

const RicVocabulary& RicVocabulary::instance() {
    static const RicVocabulary vocabulary;
    return vocabulary;
}

SetVocabulary::SetVocabulary(std::unordered_set<std::string> classes,
    std::unordered_set<std::string> object_properties,
    std::unordered_set<std::string> datatype_properties)
    : classes_(std::move(classes))
    , object_properties_(std::move(object_properties))
    , datatype_properties_(std::move(datatype_properties)) {}

bool SetVocabulary::is_class(const std::string& name) const {
    return classes_.count(name) > 0;
}

bool SetVocabulary::is_object_property(const std::string& name) const {
    return object_properties_.count(name) > 0;
}

bool SetVocabulary::is_datatype_property(const std::string& name) const {
    return datatype_properties_.count(name) > 0;
}

} // namespace drawio_model
